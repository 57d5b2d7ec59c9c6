// This file is part of Hermes.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "http_connection.hpp"
#include "http_grammar.hpp"
#include "url.hpp"
#include "enums.hpp"
#include "authority_table.hpp"
#include "../socket/abstract_stream.hpp"
#include "../base/abstract_source.hpp"
#include "../base/array_source.hpp"
#include "../base/mime_decoder.hpp"
#include "../static/main_config.hpp"
#include "../utils.hpp"
#include <rocket/ascii_case.hpp>
#include <stdlib.h>
namespace hermes {
namespace {

class Body_Source
  : public Abstract_Source
  {
  private:
    Abstract_Stream* m_stream;
    bool m_limited = false;
    uint64_t m_remaining = 0;

  protected:
    bool
    do_read_chunk(cow_string& chunk) override
      {
        size_t size = 4096;
        if(this->m_limited) {
          if(this->m_remaining == 0)
            return false;

          if(this->m_remaining < size)
            size = (size_t) this->m_remaining;
        }

        chunk.append(size, '\0');
        size_t r = this->m_stream->read_some(chunk.mut_data(), size);
        chunk.erase(r);

        if(r == 0) {
          if(this->m_limited)
            HERMES_LOG_WARN(("Response body truncated: `$1` byte(s) missing"), this->m_remaining);

          this->m_limited = true;
          this->m_remaining = 0;
          return false;
        }

        if(this->m_limited)
          this->m_remaining -= r;
        return true;
      }

  public:
    explicit
    Body_Source(Abstract_Stream& stream) noexcept
      :
        m_stream(&stream)
      { }

  public:
    Body_Source(const Body_Source&) = delete;
    Body_Source& operator=(const Body_Source&) & = delete;

    void
    set_limit(uint64_t limit) noexcept
      {
        this->m_limited = true;
        this->m_remaining = limit;
      }
  };

bool
do_parse_content_length(uint64_t& length, const cow_string& str) noexcept
  {
    if(str.empty() || (str.size() > 18))
      return false;

    length = 0;
    for(char ch : str)
      if((ch >= '0') && (ch <= '9'))
        length = length * 10 + (uint32_t) (ch - '0');
      else
        return false;
    return true;
  }

bool
do_parse_status_line(HTTP_Response& resp, const cow_string& line)
  {
    // HTTP/<digits>.<digits> <3 digits>[ <reason>]
    if((line.size() < 5) || (::rocket::ascii_ci_compare(line.data(), 5, "HTTP/", 5) != 0))
      return false;

    size_t pos = 5;
    auto match_digits = [&]
      {
        size_t from = pos;
        while((pos != line.size()) && (line[pos] >= '0') && (line[pos] <= '9'))
          pos ++;
        return pos - from;
      };

    auto skip_blanks = [&]
      {
        size_t from = pos;
        while((pos != line.size()) && is_any_of(line[pos], {' ', '\t'}))
          pos ++;
        return pos - from;
      };

    if(match_digits() == 0)
      return false;

    if((pos == line.size()) || (line[pos] != '.'))
      return false;

    pos ++;
    if(match_digits() == 0)
      return false;

    resp.version.assign(line.data(), pos);

    if(skip_blanks() == 0)
      return false;

    size_t code_pos = pos;
    if(match_digits() != 3)
      return false;

    resp.status = (uint32_t) (line[code_pos] - '0') * 100
                  + (uint32_t) (line[code_pos + 1] - '0') * 10
                  + (uint32_t) (line[code_pos + 2] - '0');

    // The code is followed by whitespace or the end of the line. Trailing
    // whitespace is not part of the reason phrase.
    resp.reason.clear();
    if((skip_blanks() == 0) && (pos != line.size()))
      return false;

    size_t epos = line.rfind_not_of(" \t\r");
    if((epos != cow_string::npos) && (epos >= pos))
      resp.reason.assign(line.data() + pos, epos + 1 - pos);
    return true;
  }

cow_string
do_format_request_for_log(const cow_string& request_line, const RFC822_Headers& headers)
  {
    // Credentials are not written to logs.
    RFC822_Headers redacted = headers;
    if(redacted.count(&"Authorization") != 0)
      redacted.supersede(&"Authorization", &"(hidden)");

    tinyfmt_str fmt;
    fmt << request_line;
    redacted.encode(fmt);
    return fmt.get_string();
  }

}  // namespace

HTTP_Connection::
HTTP_Connection(Abstract_Stream& stream, bool proxy)
  :
    m_stream(&stream), m_proxy(proxy)
  {
    this->m_default_version = main_config.copy_string_opt(&"network.http.default_version").value_or(&"HTTP/1.0");
    this->m_max_line_length = (size_t) main_config.copy_integer_opt(&"network.http.max_line_length",
                                                                     256, 1048576).value_or(16384);

    const char* env_referer = ::getenv("HTTP_REFERER");
    if(env_referer)
      this->set_default_referer(cow_string(env_referer));
  }

HTTP_Connection::
~HTTP_Connection()
  {
  }

opt<HTTP_Response>
HTTP_Connection::
request(const cow_string& method, const HTTP_Target& target, const RFC822_Headers* headers,
        Abstract_Source* body, const cow_string& version)
  {
    cow_string umethod = method;
    ascii_uppercase(umethod);
    if(umethod.empty() || !::std::all_of(umethod.begin(), umethod.end(), is_http_token_char))
      HERMES_THROW(("Invalid HTTP method `$1`"), method);

    // Escape blank characters in the target. Other characters are sent as is.
    cow_string uri;
    for(char ch : target.uri())
      if(ch == ' ')
        uri.append("%20", 3);
      else if(ch == '\t')
        uri.append("%09", 3);
      else
        uri.push_back(ch);

    URL url;
    if(!url.parse(uri))
      HERMES_THROW(("Invalid request target `$1`"), uri);

    cow_string referer;
    if(target.has_referer())
      referer = target.referer();
    else if(this->m_has_default_referer)
      referer = this->m_default_referer;
    else
      referer = target.uri();

    // Compose default headers. Those from the caller take precedence.
    RFC822_Headers req_headers;
    req_headers.add(&"Accept", &"*/*");
    req_headers.add(&"Referer", referer);

    if(url.has_host) {
      req_headers.add(&"Host", url.host_header());

      if(this->m_authorities) {
        cow_string path = url.path.empty() ? cow_string(&"/") : url.path;
        auto entry = this->m_authorities->find(url.host, url.effective_port(), path);
        if(entry && entry->has_credentials)
          req_headers.add(&"Authorization", basic_authorization(*entry));
      }
    }

    if(headers)
      req_headers.merge(*headers);

    const cow_string& req_version = version.empty() ? this->m_default_version : version;

    tinyfmt_str fmt;
    fmt << umethod << ' ' << (this->m_proxy ? uri : url.local_part()) << ' ' << req_version << "\r\n";
    cow_string request_line = fmt.get_string();
    req_headers.encode(fmt);
    fmt << "\r\n";
    this->m_stream->write(fmt.get_string());
    HERMES_LOG_DEBUG(("HTTP request:\n$1"), do_format_request_for_log(request_line, req_headers));

    if(body) {
      cow_string chunk;
      while(body->read(chunk))
        this->m_stream->write(chunk);
    }

    this->m_stream->flush();

    // Read the status line.
    cow_string line;
    if(!this->m_stream->read_line(line, this->m_max_line_length) || line.empty()) {
      HERMES_LOG_WARN(("No response from HTTP server for `$1 $2`"), umethod, uri);
      return nullopt;
    }

    HTTP_Response resp;
    if(!do_parse_status_line(resp, line)) {
      HERMES_LOG_WARN(("Bad response from HTTP server: $1"), line);
      return nullopt;
    }

    // Read headers, up to an empty line.
    size_t nbad = 0;
    while(this->m_stream->read_line(line, this->m_max_line_length) && !line.empty())
      if(!resp.headers.push_line(line))
        nbad ++;

    if(nbad != 0)
      HERMES_LOG_DEBUG(("Skipped `$1` malformed header line(s) from HTTP server"), nbad);

    HERMES_LOG_DEBUG(("HTTP response: $1 $2 $3"), resp.version, resp.status, resp.reason);
    return move(resp);
  }

opt<HTTP_Response>
HTTP_Connection::
get(const HTTP_Target& target)
  {
    return this->request(&"GET", target);
  }

opt<HTTP_Response>
HTTP_Connection::
post(const HTTP_Target& target, const cow_bivector<cow_string, cow_string>& fields,
     const RFC822_Headers* headers)
  {
    cow_vector<cow_string> lines;
    for(const auto& r : fields) {
      auto& line = lines.emplace_back();
      line = url_encode(r.first);
      line.push_back('=');
      line += url_encode(r.second);
      line.push_back('\n');
    }

    Array_Source data(lines);
    return this->request(&"POST", target, headers, &data);
  }

uniptr<Abstract_Source>
HTTP_Connection::
request_data(const cow_string& method, const HTTP_Target& target, const RFC822_Headers* headers,
             Abstract_Source* body, const cow_string& version)
  {
    auto resp = this->request(method, target, headers, body, version);
    if(!resp || (resp->status != http_status_ok))
      return nullptr;

    return this->open_body(*resp);
  }

uniptr<Abstract_Source>
HTTP_Connection::
open_body(const HTTP_Response& resp)
  {
    auto body = new_uni<Body_Source>(*(this->m_stream));

    auto value = resp.headers.find_opt(&"Content-Length");
    if(value) {
      uint64_t length;
      if(do_parse_content_length(length, *value))
        body->set_limit(length);
      else
        HERMES_LOG_WARN(("Invalid `Content-Length` from HTTP server: $1"), *value);
    }

    uniptr<Abstract_Source> source = move(body);

    value = resp.headers.find_opt(&"Content-Transfer-Encoding");
    if(value) {
      auto qenc = parse_token(*value);
      if(qenc)
        source = decode_mime_source(move(source), qenc->value);
    }

    value = resp.headers.find_opt(&"Content-Encoding");
    if(value) {
      auto qenc = parse_token(*value);
      if(qenc)
        source = decode_content_source(move(source), qenc->value);
    }

    return source;
  }

}  // namespace hermes
