/**
 * The MIT License (MIT)
 *
 * Copyright (c) 2019-2020 Edward.Wu
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy of
 * this software and associated documentation files (the "Software"), to deal in
 * the Software without restriction, including without limitation the rights to
 * use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of
 * the Software, and to permit persons to whom the Software is furnished to do so,
 * subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS
 * FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR
 * COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER
 * IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN
 * CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "SGDError.hpp"

#define SGD_MAX_TEXT_LENGTH 10000
#define SGD_MAX_HTML_LENGTH 50000
#define SGD_MAX_FILENAME_LENGTH 255

#define SGD_MB (1024 * 1024)
#define SGD_MAX_FILE_SIZE (100 * SGD_MB)
#define SGD_MAX_IMAGE_SIZE (10 * SGD_MB)
#define SGD_MAX_DOCUMENT_SIZE (50 * SGD_MB)

/**
 * One allow-listed HTML element and the attributes it may keep
 */
struct SGDSafeTag
{
    std::string name;
    std::vector<std::string> allowed_attrs;
};

typedef std::vector<SGDSafeTag> sgd_html_policy_t;

/**
 * b i u em strong p br a[href,title]
 */
sgd_html_policy_t sgd_default_html_policy();

/**
 * Outcome of a file check. error_code is meaningful only when is_valid is
 * false.
 */
struct sgd_check_result_t
{
    bool is_valid;
    SGDErrorCode error_code;
    std::string error;

    static sgd_check_result_t ok();
    static sgd_check_result_t fail(SGDErrorCode code, const std::string &message);
};

/**
 * Content security validator
 *
 * Text and HTML sanitization, file upload vetting and identifier checks.
 * Holds only its length limits and HTML policy, so one instance can be
 * shared between threads once configured.
 */
class CSGDContentSecurity
{
public:
    CSGDContentSecurity();
    ~CSGDContentSecurity();

    void set_max_text_length(size_t max_length);
    void set_max_html_length(size_t max_length);
    void set_html_policy(const sgd_html_policy_t &policy);

    size_t get_max_text_length() const { return m_max_text_length; }
    size_t get_max_html_length() const { return m_max_html_length; }
    const sgd_html_policy_t &get_html_policy() const { return m_html_policy; }

    /**
     * Strip tags, javascript: schemes and inline event handlers. The input is
     * cut to max_length UTF-8 code points first and the result is trimmed.
     * All length limits here (text, HTML, filename) count code points.
     */
    std::string sanitize_text(const std::string &text) const;
    std::string sanitize_text(const std::string &text, size_t max_length) const;

    /**
     * Keep only the tags and attributes named by policy. script and style
     * elements are dropped with their content, URL attributes must use http,
     * https or mailto, and stray angle brackets are escaped. An empty policy
     * strips all markup, like sanitize_text.
     */
    std::string sanitize_html(const std::string &html) const;
    std::string sanitize_html(const std::string &html, size_t max_length) const;
    std::string sanitize_html(const std::string &html, size_t max_length, const sgd_html_policy_t &policy) const;

    sgd_check_result_t validate_file_upload(const std::string &filename, uint64_t file_size) const;
    sgd_check_result_t validate_file_upload(const std::string &filename, uint64_t file_size,
                                            const std::string &content) const;

    /**
     * Signature heuristics only, not a malware scanner.
     */
    sgd_check_result_t scan_file_content(const std::string &content, const std::string &file_ext) const;

    static bool validate_room_id(const std::string &room_id);
    static bool validate_username(const std::string &username);

    /**
     * Hex SHA-256 of content
     */
    static std::string calculate_file_checksum(const std::string &content);

    /**
     * Lower-cased suffix of the last path component including the dot,
     * "" when there is none ("archive.tar.gz" -> ".gz", ".bashrc" -> "").
     */
    static std::string get_file_extension(const std::string &filename);

private:
    size_t m_max_text_length;
    size_t m_max_html_length;
    sgd_html_policy_t m_html_policy;
};

/**
 * First address of x-forwarded-for, x-real-ip or cf-connecting-ip (header
 * names are matched case-insensitively), default_ip otherwise.
 */
std::string sgd_get_client_ip(const std::map<std::string, std::string> &headers,
                              const std::string &default_ip = "unknown");

/**
 * Hardening headers to attach to every response
 */
const std::map<std::string, std::string> &sgd_get_security_headers();
