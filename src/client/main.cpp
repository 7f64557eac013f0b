#include <cstdlib>
#include <fmt/core.h>
#include <getopt.h>
#include <signal.h>
#include <string>
#include <vector>

#include "client/tftp_client.hpp"
#include "common/debug_macros.hpp"
#include "common/tftp.hpp"

void sig_handler(int signum);
void setup_signal_handlers();
void print_help(char *argv0);
int  initialise_logger(const bool trace);

namespace
{
  bool parse_number(const char *str, const unsigned long min, const unsigned long max, unsigned long &ret)
  {
    try
    {
      size_t            pos = 0;
      const std::string value(str);
      ret = std::stoul(value, &pos);
      return (pos == value.size()) && (ret >= min) && (ret <= max);
    }
    catch (const std::exception &)
    {
      return false;
    }
  }
}; // namespace

//==========================================================
int main(int argc, char **argv)
{
  int verbose_flag = 0;
  int help_flag    = 0;

  static struct option long_options[] = {/* These options set a flag. */
                                         {"verbose", no_argument, &verbose_flag, 1},
                                         {"help", no_argument, &help_flag, 1},
                                         /* These options don’t set a flag.
                                            We distinguish them by their indices. */
                                         {"port", required_argument, 0, 'p'},
                                         {"timeout", required_argument, 0, 't'},
                                         {"retries", required_argument, 0, 'r'},
                                         {"interface", required_argument, 0, 'i'},
                                         {0, 0, 0, 0}};

  tftp_client::config_t config;
  unsigned long         value = 0;

  while (true)
  {
    int option_index = 0;

    int c = getopt_long(argc, argv, "vp:t:r:i:", long_options, &option_index);

    if (c == -1)
      break;

    switch (c)
    {
    case 0: {
      break;
    }
    case 'p': {
      if (!parse_number(optarg, 1, 65535, value))
      {
        fmt::print(stderr, "Invalid port '{}'\n", optarg);
        return 1;
      }
      config.port = static_cast<uint16_t>(value);
      break;
    }
    case 't': {
      if (!parse_number(optarg, 1, 255, value))
      {
        fmt::print(stderr, "Invalid timeout '{}'\n", optarg);
        return 1;
      }
      config.timeout_s = static_cast<unsigned int>(value);
      break;
    }
    case 'r': {
      if (!parse_number(optarg, 0, 255, value))
      {
        fmt::print(stderr, "Invalid retry count '{}'\n", optarg);
        return 1;
      }
      config.max_retries = static_cast<uint8_t>(value);
      break;
    }
    case 'i': {
      config.local_interface = optarg;
      break;
    }
    case 'v': {
      verbose_flag = 1;
      break;
    }
    default: {
      print_help(argv[0]);
      return 1;
    }
    }
  }

  if (help_flag)
  {
    print_help(argv[0]);
    return 0;
  }

  std::vector<std::string> args;
  while (optind < argc)
  {
    args.emplace_back(argv[optind++]);
  }

  if ((args.size() != 3) || ((args[1] != "get") && (args[1] != "put")))
  {
    print_help(argv[0]);
    return 1;
  }
  const std::string &tftp_host = args[0];
  const bool         write     = (args[1] == "put");
  const std::string &filename  = args[2];

  if (initialise_logger(verbose_flag))
  {
    return 1;
  }
  setup_signal_handlers();

  // Every outcome of a transfer is reported on stdout, the exit status stays 0
  try
  {
    const auto result = write ? tftp_client::send_file(filename, tftp_host, config)
                              : tftp_client::get_file(filename, tftp_host, config);
    fmt::print("{}\n", result.message);
  }
  catch (const std::exception &err)
  {
    dbg_err("Failure : {}", err.what());
    fmt::print("Error: {}\n", err.what());
  }

  dbg_trace("Exiting...");
  return 0;
}

//==========================================================
void sig_handler(int signum)
{
  dbg_info("Received signal {}", signum);
  exit(signum);
}

//==========================================================
void setup_signal_handlers()
{
  struct sigaction new_action;
  sigemptyset(&new_action.sa_mask);
  new_action.sa_flags   = 0;
  new_action.sa_handler = sig_handler;

  sigaction(SIGINT, &new_action, NULL);
  sigaction(SIGHUP, &new_action, NULL);
  sigaction(SIGTERM, &new_action, NULL);
}

//==========================================================
void print_help(char *argv0)
{
  const char help_msg[] = R"(Usage: {} HOST get|put FILENAME [OPTIONS]
  HOST               : IP address or host name of the TFTP server
  get                : Download FILENAME into the current directory
  put                : Upload FILENAME to the server
  -p --port PORT     : Server port (default 69)
  -t --timeout SECS  : Seconds to wait for a reply before retransmitting (default 5)
  -r --retries COUNT : Retransmits before giving up on the server (default 5)
  -i --interface IP  : IP address of the local interface to send requests from (optional)
  -v --verbose       : Trace logging
     --help          : Show this message
)";
  fmt::print(stderr, fmt::runtime(help_msg), argv0);
}

//==========================================================
int initialise_logger(const bool trace)
{
  try
  {
    spdlog::set_pattern(TFTPC_LOGGER_PATTERN);
    auto err_logger = spdlog::stderr_color_st(TFTPC_LOGGER_NAME);
    err_logger->set_pattern(TFTPC_LOGGER_PATTERN);
    if (trace)
    {
      spdlog::set_level(spdlog::level::trace);
      dbg_dbg("Debug prints on");
    }
    else
    {
      spdlog::set_level(spdlog::level::warn);
    }
    dbg_dbg("Initialised log");
  }
  catch (const std::exception &)
  {
    fmt::print(stderr, "Failed to setup logger\n");
    return 1;
  }
  return 0;
}
