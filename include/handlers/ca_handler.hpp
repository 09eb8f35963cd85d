#pragma once

#include <boost/program_options.hpp>
#include <string>
#include <vector>

#include "ca/certificate_authority.hpp"
#include "customio/console_output.hpp"
#include "handlers/handler_options.hpp"
#include "handlers/i_handler.hpp"
#include "speakerctrl_common.hpp"

namespace po = boost::program_options;

namespace speakerctrl {

// speaker-ctrl ca ensure|show
class CaHandler : public IHandler {
public:
  CaHandler(ICertificateAuthority &certificate_authority, CliCtx &cli_ctx,
            customio::ConsoleOutput &output);

  std::string command() const override { return "ca"; }
  monad::MyVoidResult start() override;

  std::string print_opt_desc() const;
  monad::MyVoidResult show_usage(const std::string &msg = "");

private:
  monad::MyVoidResult handle_ensure();
  monad::MyVoidResult handle_show();

  ICertificateAuthority &certificate_authority_;
  CliCtx &cli_ctx_;
  customio::ConsoleOutput &output_;
  po::options_description opt_desc_;
  po::variables_map vm_;
  std::vector<std::string> args_;
};

} // namespace speakerctrl
