// This file is part of Hermes.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "mime_decoder.hpp"
#include "inflator.hpp"
#include "../third/openssl_fwd.hpp"
#include "../http/http_field_name.hpp"
#include "../utils.hpp"
namespace hermes {
namespace {

class Base64_Source final
  : public Abstract_Source
  {
  private:
    uniptr<Abstract_Source> m_source;
    uniptr_EVP_ENCODE_CTX m_ctx;
    bool m_finished = false;

  public:
    explicit
    Base64_Source(uniptr<Abstract_Source>&& source)
      :
        m_source(move(source)), m_ctx(::EVP_ENCODE_CTX_new())
      {
        if(!this->m_ctx)
          HERMES_THROW(("Could not allocate base64 context"));

        ::EVP_DecodeInit(this->m_ctx.get());
      }

  protected:
    bool
    do_read_chunk(cow_string& chunk) override
      {
        if(this->m_finished)
          return false;

        cow_string in;
        int outl = 0;

        if(!this->m_source->read(in)) {
          // Flush remaining data.
          chunk.append(80, '\0');
          if(::EVP_DecodeFinal(this->m_ctx.get(),
                   reinterpret_cast<unsigned char*>(chunk.mut_data()), &outl) < 0)
            HERMES_THROW(("Invalid base64 data"));

          chunk.erase((size_t) outl);
          this->m_finished = true;
          return true;
        }

        // Each block of four characters yields at most three bytes. The context
        // may have a partial line from the previous call.
        chunk.append(in.size() + 80, '\0');
        if(::EVP_DecodeUpdate(this->m_ctx.get(),
                 reinterpret_cast<unsigned char*>(chunk.mut_data()), &outl,
                 reinterpret_cast<const unsigned char*>(in.data()), (int) in.size()) < 0)
          HERMES_THROW(("Invalid base64 data"));

        chunk.erase((size_t) outl);
        return true;
      }
  };

class Quoted_Printable_Source final
  : public Abstract_Source
  {
  private:
    uniptr<Abstract_Source> m_source;
    cow_string m_pending;
    bool m_eof = false;

  public:
    explicit
    Quoted_Printable_Source(uniptr<Abstract_Source>&& source) noexcept
      :
        m_source(move(source))
      { }

  protected:
    static
    int
    do_xdigit(char ch) noexcept
      {
        if((ch >= '0') && (ch <= '9'))
          return ch - '0';
        else if((ch >= 'A') && (ch <= 'F'))
          return ch - 'A' + 10;
        else if((ch >= 'a') && (ch <= 'f'))
          return ch - 'a' + 10;
        else
          return -1;
      }

    bool
    do_read_chunk(cow_string& chunk) override
      {
        if(this->m_eof && this->m_pending.empty())
          return false;

        cow_string data;
        data.swap(this->m_pending);
        cow_string in;
        if(!this->m_eof && !this->m_source->read(in))
          this->m_eof = true;
        data.append(in);

        size_t k = 0;
        while(k < data.size()) {
          if(data[k] != '=') {
            chunk.push_back(data[k]);
            k ++;
            continue;
          }

          // An escape sequence may be split across chunks.
          if((data.size() - k < 3) && !this->m_eof) {
            this->m_pending.assign(data.data() + k, data.size() - k);
            break;
          }

          // soft line break
          if((data.size() - k >= 2) && (data[k+1] == '\n')) {
            k += 2;
            continue;
          }

          if((data.size() - k >= 3) && (data[k+1] == '\r') && (data[k+2] == '\n')) {
            k += 3;
            continue;
          }

          // `=XX`
          if(data.size() - k >= 3) {
            int hi = do_xdigit(data[k+1]);
            int lo = do_xdigit(data[k+2]);
            if((hi >= 0) && (lo >= 0)) {
              chunk.push_back((char) (hi << 4 | lo));
              k += 3;
              continue;
            }
          }

          // Copy an invalid sequence verbatim.
          chunk.push_back('=');
          k ++;
        }

        return true;
      }
  };

class Inflate_Source final
  : public Abstract_Source,
    private Inflator
  {
  private:
    uniptr<Abstract_Source> m_source;
    linear_buffer m_out;
    bool m_finished = false;

  public:
    Inflate_Source(uniptr<Abstract_Source>&& source, zlib_Format format)
      :
        Inflator(format), m_source(move(source))
      { }

  protected:
    char*
    do_on_inflate_get_output_buffer(size_t& size) override
      {
        size = this->m_out.reserve_after_end(size);
        this->m_out.accept(size);
        return this->m_out.mut_end() - size;
      }

    void
    do_on_inflate_truncate_output_buffer(size_t backup) override
      {
        this->m_out.unaccept(backup);
      }

    bool
    do_read_chunk(cow_string& chunk) override
      {
        if(this->m_finished)
          return false;

        cow_string in;
        if(this->m_source->read(in))
          this->inflate(in);
        else {
          if(!this->finish())
            HERMES_LOG_WARN(("Compressed data truncated"));
          this->m_finished = true;
        }

        chunk.append(this->m_out.data(), this->m_out.size());
        this->m_out.clear();
        return true;
      }
  };

}  // namespace

uniptr<Abstract_Source>
decode_mime_source(uniptr<Abstract_Source>&& source, const cow_string& encoding)
  {
    HTTP_Field_Name name(encoding);
    if(name == "base64")
      return new_uni<Base64_Source>(move(source));

    if(name == "quoted-printable")
      return new_uni<Quoted_Printable_Source>(move(source));

    if((name == "7bit") || (name == "8bit") || (name == "binary"))
      return move(source);

    HERMES_LOG_WARN(("Unsupported content transfer encoding `$1`"), encoding);
    return move(source);
  }

uniptr<Abstract_Source>
decode_content_source(uniptr<Abstract_Source>&& source, const cow_string& encoding)
  {
    HTTP_Field_Name name(encoding);
    if((name == "gzip") || (name == "x-gzip"))
      return new_uni<Inflate_Source>(move(source), zlib_gzip);

    if(name == "deflate")
      return new_uni<Inflate_Source>(move(source), zlib_deflate);

    if(name == "identity")
      return move(source);

    HERMES_LOG_WARN(("Unsupported content encoding `$1`"), encoding);
    return move(source);
  }

}  // namespace hermes
