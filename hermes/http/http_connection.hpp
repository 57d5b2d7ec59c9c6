// This file is part of Hermes.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef HERMES_HTTP_HTTP_CONNECTION_
#define HERMES_HTTP_HTTP_CONNECTION_

#include "../fwd.hpp"
#include "http_target.hpp"
#include "http_response.hpp"
#include "rfc822_headers.hpp"
namespace hermes {

// This performs synchronous request/response exchanges over a stream which
// is owned by the caller. Only one request may be outstanding at a time.
class HTTP_Connection
  {
  private:
    Abstract_Stream* m_stream;
    bool m_proxy;
    bool m_has_default_referer = false;
    cow_string m_default_referer;
    cow_string m_default_version;
    size_t m_max_line_length;
    const Authority_Table* m_authorities = nullptr;

  public:
    // Attaches to `stream`, which must outlive this object. If `proxy` is
    // set, full URIs are sent in request lines. Defaults are taken from
    // 'main.conf', and the default referer from the `HTTP_REFERER`
    // environment variable.
    explicit
    HTTP_Connection(Abstract_Stream& stream, bool proxy = false);

  public:
    HTTP_Connection(const HTTP_Connection&) = delete;
    HTTP_Connection& operator=(const HTTP_Connection&) & = delete;
    ~HTTP_Connection();

    Abstract_Stream&
    stream()
      const noexcept
      { return *(this->m_stream);  }

    bool
    is_proxy()
      const noexcept
      { return this->m_proxy;  }

    const cow_string&
    default_version()
      const noexcept
      { return this->m_default_version;  }

    // Sets the referer for plain targets. If no default referer is set, the
    // target itself is used.
    void
    set_default_referer(const cow_string& referer)
      {
        this->m_default_referer = referer;
        this->m_has_default_referer = true;
      }

    void
    clear_default_referer()
      noexcept
      {
        this->m_default_referer.clear();
        this->m_has_default_referer = false;
      }

    // Sets the table to look up credentials in. The table is not copied and
    // must outlive this object. A null pointer disables authorization.
    void
    set_authority_table(const Authority_Table* table)
      noexcept
      { this->m_authorities = table;  }

    // Sends a request, and reads the status line and headers of its response.
    // `method` must be a token, and is converted to uppercase. Fields in
    // `headers` supersede default ones. Chunks from `body` are sent after
    // the headers. If `version` is empty, the default one is used.
    // If no response is received, or the status line is malformed, a
    // warning is logged and `nullopt` is returned. Invalid arguments and
    // I/O errors cause exceptions.
    opt<HTTP_Response>
    request(const cow_string& method, const HTTP_Target& target,
            const RFC822_Headers* headers = nullptr, Abstract_Source* body = nullptr,
            const cow_string& version = empty_cow_string);

    opt<HTTP_Response>
    get(const HTTP_Target& target);

    // Sends a POST request with fields in the body. Each field is encoded as
    // a line `key=value`, where both parts are URL-encoded.
    opt<HTTP_Response>
    post(const HTTP_Target& target, const cow_bivector<cow_string, cow_string>& fields,
         const RFC822_Headers* headers = nullptr);

    // Sends a request, and returns a source of its response body if the
    // status is 200. Otherwise, a null pointer is returned.
    uniptr<Abstract_Source>
    request_data(const cow_string& method, const HTTP_Target& target,
                 const RFC822_Headers* headers = nullptr, Abstract_Source* body = nullptr,
                 const cow_string& version = empty_cow_string);

    // Returns a source that reads the body of `resp` from the stream. The body
    // extends to `Content-Length` bytes if specified, or to the end of the
    // stream otherwise. It is decoded according to `Content-Transfer-Encoding`
    // and `Content-Encoding`.
    uniptr<Abstract_Source>
    open_body(const HTTP_Response& resp);
  };

}  // namespace hermes
#endif
