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

#include <algorithm>
#include <iomanip>
#include <regex>
#include <set>
#include <sstream>
#include <openssl/sha.h>
#include "spdlog/spdlog.h"

#include "common.hpp"
#include "SGDContentSecurity.hpp"
#include "SGDLog.hpp"

static const std::set<std::string> g_allowed_extensions = {
    // documents
    ".pdf", ".doc", ".docx", ".xls", ".xlsx", ".ppt", ".pptx",
    ".txt", ".rtf", ".odt", ".ods", ".odp",
    // images
    ".jpg", ".jpeg", ".png", ".gif", ".webp", ".bmp", ".svg",
    // archives
    ".zip", ".tar", ".gz", ".7z", ".rar",
    // media
    ".mp3", ".mp4", ".wav", ".m4a", ".webm", ".ogg",
    // data
    ".json", ".xml", ".csv", ".yml", ".yaml"};

static const std::set<std::string> g_blocked_extensions = {
    ".exe", ".bat", ".cmd", ".com", ".pif", ".scr",
    ".vbs", ".vbe", ".js", ".jse", ".wsf", ".wsh",
    ".msi", ".msp", ".dll", ".sh", ".bash", ".zsh",
    ".app", ".deb", ".rpm", ".dmg", ".pkg"};

static const std::set<std::string> g_image_extensions = {
    ".jpg", ".jpeg", ".png", ".gif", ".webp", ".bmp"};

static const std::set<std::string> g_document_extensions = {
    ".pdf", ".doc", ".docx", ".xls", ".xlsx"};

static const std::set<std::string> g_script_sensitive_extensions = {
    ".jpg", ".jpeg", ".png", ".pdf"};

static const char *g_suspicious_patterns[] = {
    "<script", "javascript:", "eval(", "document.cookie", "<iframe", "onerror=", "onload="};

static const char *g_residual_markers[] = {
    "<script", "javascript:", "onerror=", "onload="};

static const std::set<std::string> g_url_attributes = {
    "href", "src", "action", "formaction", "cite", "background", "poster", "xlink:href"};

sgd_html_policy_t sgd_default_html_policy()
{
    sgd_html_policy_t policy;
    policy.push_back({"b", {}});
    policy.push_back({"i", {}});
    policy.push_back({"u", {}});
    policy.push_back({"em", {}});
    policy.push_back({"strong", {}});
    policy.push_back({"p", {}});
    policy.push_back({"br", {}});
    policy.push_back({"a", {"href", "title"}});
    return policy;
}

sgd_check_result_t sgd_check_result_t::ok()
{
    sgd_check_result_t result;
    result.is_valid = true;
    result.error_code = SGDErrorCode::UNKNOWN_ERROR;
    return result;
}

sgd_check_result_t sgd_check_result_t::fail(SGDErrorCode code, const std::string &message)
{
    sgd_check_result_t result;
    result.is_valid = false;
    result.error_code = code;
    result.error = message;
    return result;
}

/**
 * HTML tokenizer helpers
 */

static bool is_tag_name_char(char c)
{
    return isalnum((unsigned char)c) || c == '-' || c == ':';
}

static std::string escape_attr_value(const std::string &value)
{
    std::string out;
    out.reserve(value.size());
    for (char c : value)
    {
        switch (c)
        {
        case '&': out += "&amp;"; break;
        case '"': out += "&quot;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        default: out.push_back(c); break;
        }
    }
    return out;
}

// Scheme check on a URL with whitespace and control characters removed,
// the way browsers read "java\tscript:".
static bool is_safe_url(const std::string &url)
{
    std::string compact;
    for (char c : url)
    {
        if ((unsigned char)c > 0x20)
            compact.push_back((char)tolower((unsigned char)c));
    }

    size_t colon = compact.find(':');
    if (colon == std::string::npos)
        return true;
    size_t delim = compact.find_first_of("/?#");
    if (delim != std::string::npos && delim < colon)
        return true; // relative URL, the colon is in the path or query

    std::string scheme = compact.substr(0, colon);
    return scheme == "http" || scheme == "https" || scheme == "mailto";
}

// Position just past the '>' closing the tag opened at pos, honouring quoted
// attribute values. npos if the tag never closes.
static size_t find_tag_end(const std::string &html, size_t pos)
{
    char quote = 0;
    for (size_t i = pos + 1; i < html.size(); i++)
    {
        char c = html[i];
        if (quote)
        {
            if (c == quote)
                quote = 0;
        }
        else if (c == '"' || c == '\'')
        {
            quote = c;
        }
        else if (c == '>')
        {
            return i + 1;
        }
    }
    return std::string::npos;
}

struct sgd_html_attr_t
{
    std::string name;
    std::string value;
    bool has_value;
};

// Parse "name a=1 b='2' c" (the inside of a tag after the '<' and optional '/').
static void parse_tag(const std::string &inner, std::string &name, std::vector<sgd_html_attr_t> &attrs, bool &self_closing)
{
    size_t i = 0;
    while (i < inner.size() && is_tag_name_char(inner[i]))
        i++;
    name = sgd_strlower(inner.substr(0, i));
    self_closing = false;

    while (i < inner.size())
    {
        while (i < inner.size() && isspace((unsigned char)inner[i]))
            i++;
        if (i >= inner.size())
            break;
        if (inner[i] == '/')
        {
            self_closing = true;
            i++;
            continue;
        }

        size_t start = i;
        while (i < inner.size() && !isspace((unsigned char)inner[i]) && inner[i] != '=' && inner[i] != '/')
            i++;
        sgd_html_attr_t attr;
        attr.name = sgd_strlower(inner.substr(start, i - start));
        attr.has_value = false;
        if (attr.name.empty())
        {
            i++;
            continue;
        }
        self_closing = false;

        while (i < inner.size() && isspace((unsigned char)inner[i]))
            i++;
        if (i < inner.size() && inner[i] == '=')
        {
            i++;
            while (i < inner.size() && isspace((unsigned char)inner[i]))
                i++;
            attr.has_value = true;
            if (i < inner.size() && (inner[i] == '"' || inner[i] == '\''))
            {
                char quote = inner[i++];
                size_t end = inner.find(quote, i);
                if (end == std::string::npos)
                    end = inner.size();
                attr.value = inner.substr(i, end - i);
                i = end + 1;
            }
            else
            {
                size_t vstart = i;
                while (i < inner.size() && !isspace((unsigned char)inner[i]))
                    i++;
                attr.value = inner.substr(vstart, i - vstart);
            }
        }
        attrs.push_back(attr);
    }
}

static const SGDSafeTag *find_safe_tag(const sgd_html_policy_t &policy, const std::string &name)
{
    for (const SGDSafeTag &tag : policy)
    {
        if (sgd_strlower(tag.name) == name)
            return &tag;
    }
    return NULL;
}

static bool attr_allowed(const SGDSafeTag &tag, const std::string &attr)
{
    for (const std::string &allowed : tag.allowed_attrs)
    {
        if (sgd_strlower(allowed) == attr)
            return true;
    }
    return false;
}

// Skip a raw-text element (script, style) starting after its opening tag.
// Returns the position after the matching close tag, or the end of input.
static size_t skip_raw_text(const std::string &html, size_t pos, const std::string &name)
{
    std::string close = "</" + name;
    auto icase_eq = [](char a, char b) { return tolower((unsigned char)a) == tolower((unsigned char)b); };

    std::string::const_iterator it = html.begin() + pos;
    while ((it = std::search(it, html.end(), close.begin(), close.end(), icase_eq)) != html.end())
    {
        size_t after = (it - html.begin()) + close.size();
        if (after >= html.size() || !is_tag_name_char(html[after]))
        {
            size_t end = html.find('>', after);
            return end == std::string::npos ? html.size() : end + 1;
        }
        it = html.begin() + after;
    }
    return html.size();
}

/**
 * Plain text stripping passes, each a single left-to-right walk
 */

static bool is_word_char(char c)
{
    return isalnum((unsigned char)c) || c == '_';
}

// Drop every <...> span holding at least one character.
static std::string strip_tags(const std::string &in)
{
    std::string out;
    out.reserve(in.size());
    size_t i = 0;
    size_t next_close = in.find('>');
    while (i < in.size())
    {
        if (in[i] == '<')
        {
            if (next_close != std::string::npos && next_close < i)
                next_close = in.find('>', i);
            if (next_close != std::string::npos && next_close > i + 1)
            {
                i = next_close + 1;
                continue;
            }
        }
        out.push_back(in[i]);
        i++;
    }
    return out;
}

static std::string strip_icase(const std::string &in, const std::string &needle)
{
    std::string out;
    out.reserve(in.size());
    size_t i = 0;
    while (i < in.size())
    {
        if (in.size() - i >= needle.size() &&
            std::equal(needle.begin(), needle.end(), in.begin() + i,
                       [](char a, char b) { return tolower((unsigned char)a) == tolower((unsigned char)b); }))
        {
            i += needle.size();
            continue;
        }
        out.push_back(in[i]);
        i++;
    }
    return out;
}

// Drop inline handlers of the form on<word><spaces>=, matched case-insensitively.
static std::string strip_event_handlers(const std::string &in)
{
    std::string out;
    out.reserve(in.size());
    size_t i = 0;
    // end of a word run already known not to be followed by '='
    size_t no_match_until = 0;
    while (i < in.size())
    {
        if (i >= no_match_until && i + 2 < in.size() && tolower((unsigned char)in[i]) == 'o' &&
            tolower((unsigned char)in[i + 1]) == 'n' && is_word_char(in[i + 2]))
        {
            size_t j = i + 3;
            while (j < in.size() && is_word_char(in[j]))
                j++;
            size_t word_end = j;
            while (j < in.size() && isspace((unsigned char)in[j]))
                j++;
            if (j < in.size() && in[j] == '=')
            {
                i = j + 1;
                continue;
            }
            no_match_until = word_end;
        }
        out.push_back(in[i]);
        i++;
    }
    return out;
}

/**
 * CSGDContentSecurity class implementation
 */

CSGDContentSecurity::CSGDContentSecurity()
    : m_max_text_length(SGD_MAX_TEXT_LENGTH),
      m_max_html_length(SGD_MAX_HTML_LENGTH),
      m_html_policy(sgd_default_html_policy())
{
}

CSGDContentSecurity::~CSGDContentSecurity()
{
}

void CSGDContentSecurity::set_max_text_length(size_t max_length)
{
    m_max_text_length = max_length;
}

void CSGDContentSecurity::set_max_html_length(size_t max_length)
{
    m_max_html_length = max_length;
}

void CSGDContentSecurity::set_html_policy(const sgd_html_policy_t &policy)
{
    m_html_policy = policy;
}

std::string CSGDContentSecurity::sanitize_text(const std::string &text) const
{
    return sanitize_text(text, m_max_text_length);
}

std::string CSGDContentSecurity::sanitize_text(const std::string &text, size_t max_length) const
{
    if (text.empty())
        return "";

    std::string out = sgd_utf8_truncate(text, max_length);
    out = strip_tags(out);
    out = strip_icase(out, "javascript:");
    out = strip_event_handlers(out);

    for (const char *marker : g_residual_markers)
    {
        if (sgd_icontains(out, marker))
        {
            spdlog::warn("[security] Suspicious content detected and sanitized, marker={}", marker);
            break;
        }
    }

    return sgd_strtrim(out);
}

std::string CSGDContentSecurity::sanitize_html(const std::string &html) const
{
    return sanitize_html(html, m_max_html_length, m_html_policy);
}

std::string CSGDContentSecurity::sanitize_html(const std::string &html, size_t max_length) const
{
    return sanitize_html(html, max_length, m_html_policy);
}

std::string CSGDContentSecurity::sanitize_html(const std::string &html, size_t max_length,
                                               const sgd_html_policy_t &policy) const
{
    if (html.empty())
        return "";

    if (policy.empty())
        return sanitize_text(html, max_length);

    std::string in = sgd_utf8_truncate(html, max_length);
    std::string out;
    out.reserve(in.size());
    int dropped_tags = 0;

    size_t i = 0;
    while (i < in.size())
    {
        char c = in[i];
        if (c == '>')
        {
            out += "&gt;";
            i++;
            continue;
        }
        if (c != '<')
        {
            out.push_back(c);
            i++;
            continue;
        }

        // comments and declarations are dropped whole
        if (in.compare(i, 4, "<!--") == 0)
        {
            size_t end = in.find("-->", i + 4);
            i = (end == std::string::npos) ? in.size() : end + 3;
            dropped_tags++;
            continue;
        }

        size_t name_pos = i + 1;
        bool closing = false;
        if (name_pos < in.size() && in[name_pos] == '/')
        {
            closing = true;
            name_pos++;
        }
        bool declaration = name_pos < in.size() && (in[name_pos] == '!' || in[name_pos] == '?');
        if (name_pos >= in.size() || (!isalpha((unsigned char)in[name_pos]) && !declaration))
        {
            out += "&lt;";
            i++;
            continue;
        }

        size_t tag_end = find_tag_end(in, i);
        if (tag_end == std::string::npos)
        {
            out += "&lt;";
            i++;
            continue;
        }
        if (declaration)
        {
            i = tag_end;
            dropped_tags++;
            continue;
        }

        std::string inner = in.substr(name_pos, tag_end - 1 - name_pos);
        std::string name;
        std::vector<sgd_html_attr_t> attrs;
        bool self_closing = false;
        parse_tag(inner, name, attrs, self_closing);
        i = tag_end;

        if (!closing && (name == "script" || name == "style"))
        {
            i = skip_raw_text(in, i, name);
            dropped_tags++;
            continue;
        }

        const SGDSafeTag *safe = find_safe_tag(policy, name);
        if (!safe)
        {
            dropped_tags++;
            continue;
        }

        if (closing)
        {
            out += "</" + name + ">";
            continue;
        }

        out += "<" + name;
        for (const sgd_html_attr_t &attr : attrs)
        {
            if (attr.name.compare(0, 2, "on") == 0 || !attr_allowed(*safe, attr.name))
                continue;
            if (g_url_attributes.count(attr.name) && !is_safe_url(attr.value))
            {
                spdlog::warn("[security] sanitize_html, unsafe URL removed from <{} {}>.", name, attr.name);
                continue;
            }
            out += " " + attr.name;
            if (attr.has_value)
                out += "=\"" + escape_attr_value(attr.value) + "\"";
        }
        out += self_closing ? " />" : ">";
    }

    if (dropped_tags > 0)
        spdlog::debug("[security] sanitize_html, dropped {} disallowed tags.", dropped_tags);

    return sgd_strtrim(out);
}

sgd_check_result_t CSGDContentSecurity::validate_file_upload(const std::string &filename, uint64_t file_size) const
{
    if (filename.empty() || sgd_utf8_length(filename) > SGD_MAX_FILENAME_LENGTH)
        return sgd_check_result_t::fail(SGDErrorCode::VALIDATION_ERROR, "Invalid filename");

    std::string file_ext = get_file_extension(filename);

    if (g_blocked_extensions.count(file_ext))
    {
        spdlog::warn("[security] Blocked file extension: {}", file_ext);
        sgd_get_summary_logger().record_content_rejected();
        return sgd_check_result_t::fail(SGDErrorCode::FILE_TYPE_NOT_ALLOWED, "File type not allowed: " + file_ext);
    }

    if (!g_allowed_extensions.count(file_ext))
    {
        spdlog::warn("[security] File extension not in allowlist: '{}'", file_ext);
        sgd_get_summary_logger().record_content_rejected();
        return sgd_check_result_t::fail(SGDErrorCode::FILE_TYPE_NOT_ALLOWED, "File type not supported: " + file_ext);
    }

    if (file_size > (uint64_t)SGD_MAX_FILE_SIZE)
        return sgd_check_result_t::fail(SGDErrorCode::FILE_TOO_LARGE,
                                        "File too large (max " + std::to_string(SGD_MAX_FILE_SIZE / SGD_MB) + "MB)");

    if (g_image_extensions.count(file_ext) && file_size > (uint64_t)SGD_MAX_IMAGE_SIZE)
        return sgd_check_result_t::fail(SGDErrorCode::FILE_TOO_LARGE,
                                        "Image too large (max " + std::to_string(SGD_MAX_IMAGE_SIZE / SGD_MB) + "MB)");

    if (g_document_extensions.count(file_ext) && file_size > (uint64_t)SGD_MAX_DOCUMENT_SIZE)
        return sgd_check_result_t::fail(SGDErrorCode::FILE_TOO_LARGE,
                                        "Document too large (max " + std::to_string(SGD_MAX_DOCUMENT_SIZE / SGD_MB) + "MB)");

    return sgd_check_result_t::ok();
}

sgd_check_result_t CSGDContentSecurity::validate_file_upload(const std::string &filename, uint64_t file_size,
                                                             const std::string &content) const
{
    sgd_check_result_t result = validate_file_upload(filename, file_size);
    if (!result.is_valid || content.empty())
        return result;
    return scan_file_content(content, get_file_extension(filename));
}

sgd_check_result_t CSGDContentSecurity::scan_file_content(const std::string &content, const std::string &file_ext) const
{
    for (const char *pattern : g_suspicious_patterns)
    {
        if (sgd_icontains(content, pattern))
        {
            spdlog::warn("[security] Suspicious pattern detected in file, pattern={}", pattern);
            sgd_get_summary_logger().record_content_rejected();
            return sgd_check_result_t::fail(SGDErrorCode::MALICIOUS_FILE_DETECTED, "Potentially malicious content detected");
        }
    }

    if (content.compare(0, 2, "MZ") == 0)
    {
        spdlog::warn("[security] Executable detected in uploaded file, ext={}", file_ext);
        sgd_get_summary_logger().record_content_rejected();
        return sgd_check_result_t::fail(SGDErrorCode::MALICIOUS_FILE_DETECTED, "Executable content not allowed");
    }

    if (g_script_sensitive_extensions.count(sgd_strlower(file_ext)) &&
        (sgd_icontains(content, "<script") || sgd_icontains(content, "javascript:")))
    {
        spdlog::warn("[security] Embedded script detected in file, ext={}", file_ext);
        sgd_get_summary_logger().record_content_rejected();
        return sgd_check_result_t::fail(SGDErrorCode::MALICIOUS_FILE_DETECTED, "Embedded scripts not allowed");
    }

    if (content.empty())
        return sgd_check_result_t::fail(SGDErrorCode::VALIDATION_ERROR, "Empty file not allowed");

    return sgd_check_result_t::ok();
}

bool CSGDContentSecurity::validate_room_id(const std::string &room_id)
{
    if (room_id.size() < 3 || room_id.size() > 64)
        return false;
    static const std::regex room_re("^[a-zA-Z0-9_-]+$");
    return std::regex_match(room_id, room_re);
}

bool CSGDContentSecurity::validate_username(const std::string &username)
{
    if (username.size() < 3 || username.size() > 50)
        return false;
    static const std::regex username_re("^[a-zA-Z0-9][a-zA-Z0-9._-]*$");
    return std::regex_match(username, username_re);
}

std::string CSGDContentSecurity::calculate_file_checksum(const std::string &content)
{
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char *>(content.data()), content.size(), hash);
    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++)
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
    return ss.str();
}

std::string CSGDContentSecurity::get_file_extension(const std::string &filename)
{
    size_t slash = filename.find_last_of('/');
    std::string base = (slash == std::string::npos) ? filename : filename.substr(slash + 1);
    size_t dot = base.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == base.size())
        return "";
    return sgd_strlower(base.substr(dot));
}

std::string sgd_get_client_ip(const std::map<std::string, std::string> &headers, const std::string &default_ip)
{
    static const char *proxy_headers[] = {"x-forwarded-for", "x-real-ip", "cf-connecting-ip"};

    for (const char *wanted : proxy_headers)
    {
        for (const auto &header : headers)
        {
            if (sgd_strlower(header.first) != wanted)
                continue;
            std::string ip = sgd_strtrim(header.second.substr(0, header.second.find(',')));
            if (!ip.empty())
                return ip;
        }
    }
    return default_ip;
}

const std::map<std::string, std::string> &sgd_get_security_headers()
{
    static const std::map<std::string, std::string> headers = {
        {"X-Content-Type-Options", "nosniff"},
        {"X-Frame-Options", "DENY"},
        {"X-XSS-Protection", "1; mode=block"},
        {"Strict-Transport-Security", "max-age=31536000; includeSubDomains"},
        {"Content-Security-Policy", "default-src 'self'; script-src 'self'; style-src 'self' 'unsafe-inline'"}};
    return headers;
}
