// This file is part of Hermes.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "xprecompiled.hpp"
#include "base/config_file.hpp"
#include "base/abstract_source.hpp"
#include "static/main_config.hpp"
#include "static/logger.hpp"
#include "socket/tcp_stream.hpp"
#include "http/enums.hpp"
#include "http/url.hpp"
#include "http/authority_table.hpp"
#include "http/rfc822_headers.hpp"
#include "http/http_grammar.hpp"
#include "http/http_connection.hpp"
#include "utils.hpp"
#include <locale.h>
#include <signal.h>
#include <stdarg.h>
namespace {
using namespace hermes;

[[noreturn]]
int
do_print_help_and_exit(const char* self)
  {
    ::printf(
//        1         2         3         4         5         6         7     |
// 3456789012345678901234567890123456789012345678901234567890123456789012345|
"""""""""""""""""""""""""""""""""""""""""""""""""""""""""" R"'''''''''''''''(
Usage: %s [OPTIONS] [--] URL

  -c FILE       load configuration from FILE instead of 'main.conf'
  -d KEY=VALUE  add a form field, and send a POST request instead of GET
  -H LINE       add a request header, like `Accept-Language: en`
  -h            show help message then exit
  -u USER:PASS  use basic authentication for the host of URL
  -V            show version information then exit
  -v            enable verbose mode
  -x HOST:PORT  send the request via an HTTP proxy

The response body is written to standard output. If the response status is
not 200, the status line is written to standard error, and the exit status
is 3.
)'''''''''''''''" """"""""""""""""""""""""""""""""""""""""""""""""""""""""+1,
// 3456789012345678901234567890123456789012345678901234567890123456789012345|
//        1         2         3         4         5         6         7     |
      self);

    ::fflush(nullptr);
    ::quick_exit(0);
  }

[[noreturn]]
int
do_print_version_and_exit()
  {
    ::printf(
//        1         2         3         4         5         6         7     |
// 3456789012345678901234567890123456789012345678901234567890123456789012345|
"""""""""""""""""""""""""""""""""""""""""""""""""""""""""" R"'''''''''''''''(
%s (internal %s)
)'''''''''''''''" """"""""""""""""""""""""""""""""""""""""""""""""""""""""+1,
// 3456789012345678901234567890123456789012345678901234567890123456789012345|
//        1         2         3         4         5         6         7     |
      PACKAGE_STRING, HERMES_ABI_VERSION_STRING);

    ::fflush(nullptr);
    ::quick_exit(0);
  }

// Define command-line options here.
struct Command_Line_Options
  {
    // options
    bool verbose = false;
    cow_string conf_path;
    cow_string proxy;
    cow_string credentials;
    cow_vector<cow_string> headers;
    cow_bivector<cow_string, cow_string> fields;

    // non-options
    cow_string url;
  };

// They are declared here for convenience.
Command_Line_Options cmdline;

// These are process exit status codes.
enum
  {
    exit_success            = 0,
    exit_system_error       = 1,
    exit_invalid_argument   = 2,
    exit_http_failure       = 3,
  };

[[noreturn]] ROCKET_NEVER_INLINE
int
do_exit_printf(int code, const char* fmt = nullptr, ...) noexcept
  {
    ::fflush(nullptr);

    if(fmt) {
      // Output the string to standard error.
      ::va_list ap;
      va_start(ap, fmt);
      ::vfprintf(stderr, fmt, ap);
      va_end(ap);
      ::fputc('\n', stderr);
    }

    // Perform fast exit.
    ::quick_exit(code);
  }

ROCKET_NEVER_INLINE
void
do_parse_command_line(int argc, char** argv)
  {
    bool help = false;
    bool version = false;

    if(argc > 1) {
      // Check for common long options before calling `getopt()`.
      if(::strcmp(argv[1], "--help") == 0)
        do_print_help_and_exit(argv[0]);

      if(::strcmp(argv[1], "--version") == 0)
        do_print_version_and_exit();
    }

    // Parse command-line options.
    int ch;
    const char* sep;
    while((ch = ::getopt(argc, argv, "c:d:H:hu:Vvx:")) != -1)
      switch(ch)
        {
        case 'c':
          cmdline.conf_path.assign(::optarg);
          break;

        case 'd':
          sep = ::strchr(::optarg, '=');
          if(!sep)
            do_exit_printf(exit_invalid_argument,
                "%s: invalid form field -- '%s'\nTry `%s -h` for help.",
                argv[0], ::optarg, argv[0]);

          cmdline.fields.emplace_back(cow_string(::optarg, (size_t) (sep - ::optarg)),
                                      cow_string(sep + 1));
          break;

        case 'H':
          cmdline.headers.emplace_back(::optarg);
          break;

        case 'h':
          help = true;
          break;

        case 'u':
          if(!::strchr(::optarg, ':'))
            do_exit_printf(exit_invalid_argument,
                "%s: credentials must be `USER:PASS` -- '%s'\nTry `%s -h` for help.",
                argv[0], ::optarg, argv[0]);

          cmdline.credentials.assign(::optarg);
          break;

        case 'V':
          version = true;
          break;

        case 'v':
          cmdline.verbose = true;
          break;

        case 'x':
          cmdline.proxy.assign(::optarg);
          break;

        default:
          do_exit_printf(exit_invalid_argument,
              "%s: invalid argument -- '%c'\nTry `%s -h` for help.",
              argv[0], ::optopt, argv[0]);
        }

    // Check for early exit conditions.
    if(help)
      do_print_help_and_exit(argv[0]);

    if(version)
      do_print_version_and_exit();

    if(argc - ::optind != 1)
      do_exit_printf(exit_invalid_argument,
          "%s: exactly one URL is required\nTry `%s -h` for help.",
          argv[0], argv[0]);

    cmdline.url.assign(argv[::optind]);
  }

ROCKET_NEVER_INLINE
void
do_load_configuration()
  {
    // If no file is specified, 'main.conf' in the working directory is
    // loaded if it exists.
    cow_string conf_path = cmdline.conf_path;
    if(conf_path.empty() && (::access("main.conf", R_OK) == 0))
      conf_path = &"main.conf";

    if(!conf_path.empty())
      main_config.reload(conf_path);

    logger.reload(main_config.copy(), cmdline.verbose);
  }

ROCKET_NEVER_INLINE
void
do_load_authorities(Authority_Table& table, const URL& url)
  {
    // Credentials from the command line take precedence, as the first entry
    // among equal prefixes is preferred.
    if(!cmdline.credentials.empty()) {
      size_t colon = cmdline.credentials.find(':');
      table.add(url.host, url.effective_port(), &"/",
                cow_string(cmdline.credentials.data(), colon),
                cow_string(cmdline.credentials.data() + colon + 1));
    }

    const auto conf = main_config.copy();
    size_t count = conf.get_array_size_opt(&"authorities").value_or(0);
    for(size_t k = 0;  k != count;  ++k) {
      cow_string host = conf.get_string(sformat("authorities[$1].host", k));
      auto port = (uint16_t) conf.get_integer_opt(sformat("authorities[$1].port", k), 1, 65535).value_or(80);
      cow_string path = conf.get_string_opt(sformat("authorities[$1].path", k)).value_or(&"/");
      auto user = conf.get_string_opt(sformat("authorities[$1].user", k));

      if(user) {
        cow_string password = conf.get_string_opt(sformat("authorities[$1].password", k)).value_or(&"");
        table.add(host, port, path, *user, password);
      }
      else
        table.add(host, port, path);

      HERMES_LOG_DEBUG(("Loaded authority `$1:$2$3`"), host, port, path);
    }
  }

ROCKET_NEVER_INLINE
void
do_parse_request_headers(RFC822_Headers& headers)
  {
    for(const auto& line : cmdline.headers)
      if(!headers.push_line(line))
        do_exit_printf(exit_invalid_argument,
            "Invalid request header -- '%s'", line.c_str());
  }

ROCKET_NEVER_INLINE
void
do_report_failure(const HTTP_Response& resp)
  {
    ::fprintf(stderr, "%s %u %s\n", resp.version.c_str(), resp.status,
              resp.reason.empty() ? describe_http_status(resp.status) : resp.reason.c_str());

    if(resp.status != http_status_unauthorized)
      return;

    // WWW-Authenticate: Basic realm="example"
    auto value = resp.headers.find_opt(&"WWW-Authenticate");
    if(!value)
      return;

    auto scheme = parse_token(*value);
    if(!scheme)
      return;

    auto attrs = parse_attributes(scheme->tail);
    for(const auto& r : attrs.attributes)
      if(r.first == "REALM")
        ::fprintf(stderr, "Authentication required: scheme `%s`, realm `%s`\n",
                  scheme->value.c_str(), r.second.c_str());
  }

ROCKET_NEVER_INLINE
void
do_copy_body(Abstract_Source& body)
  {
    cow_string chunk;
    while(body.read(chunk))
      if(::fwrite(chunk.data(), 1, chunk.size(), stdout) != chunk.size())
        HERMES_THROW((
            "Could not write response body",
            "[`fwrite()` failed: ${errno:full}]"));

    if(::fflush(stdout) != 0)
      HERMES_THROW((
          "Could not write response body",
          "[`fflush()` failed: ${errno:full}]"));
  }

}  // namespace

int
main(int argc, char** argv)
  try {
    // Select the C locale.
    ::setlocale(LC_ALL, "C.UTF-8");
    ::tzset();

    // Writing to a closed connection shall not kill the process.
    struct sigaction sigact = { };
    sigact.sa_handler = SIG_IGN;
    ::sigaction(SIGPIPE, &sigact, nullptr);

    // Note that this function shall not return in case of errors.
    do_parse_command_line(argc, argv);
    do_load_configuration();

    URL url;
    if(!url.parse(cmdline.url) || !url.has_host)
      do_exit_printf(exit_invalid_argument, "Invalid URL -- '%s'", cmdline.url.c_str());

    if(!url.scheme.empty() && (url.scheme != "http"))
      do_exit_printf(exit_invalid_argument, "Unsupported scheme -- '%s'", url.scheme.c_str());

    // Get the address to connect to.
    cow_string host = url.host;
    uint16_t port = url.effective_port();
    bool proxy = !cmdline.proxy.empty();
    if(proxy) {
      Network_Reference ref;
      ref.port_num = 80;
      if(parse_network_reference(ref, cmdline.proxy) != cmdline.proxy.size())
        do_exit_printf(exit_invalid_argument, "Invalid proxy -- '%s'", cmdline.proxy.c_str());

      host.assign(ref.host.p, ref.host.n);
      port = ref.port_num;
    }

    Authority_Table authorities;
    do_load_authorities(authorities, url);

    RFC822_Headers headers;
    do_parse_request_headers(headers);

    TCP_Stream stream;
    if(!stream.connect(host, port))
      do_exit_printf(exit_system_error, "Could not connect to '%s:%u'", host.c_str(), port);

    HTTP_Connection conn(stream, proxy);
    conn.set_authority_table(&authorities);

    opt<HTTP_Response> resp;
    if(cmdline.fields.empty())
      resp = conn.request(&"GET", cmdline.url, &headers);
    else
      resp = conn.post(cmdline.url, cmdline.fields, &headers);

    if(!resp)
      do_exit_printf(exit_http_failure, "No valid response from '%s:%u'", host.c_str(), port);

    if(resp->status != http_status_ok) {
      do_report_failure(*resp);
      do_exit_printf(exit_http_failure);
    }

    auto body = conn.open_body(*resp);
    do_copy_body(*body);
    stream.close();
    do_exit_printf(exit_success);
  }
  catch(exception& stdex) {
    // Print the message in `stdex`. There isn't much we can do.
    HERMES_LOG_FATAL(("$1"), stdex);
    do_exit_printf(exit_system_error, "%s", stdex.what());
  }
