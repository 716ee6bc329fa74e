#pragma once
#include "protocol/run_request.hpp"
#include <string>
#include "core/errors/agent_errors.hpp"

namespace stride::app::cli {
    stride::core::errors::Result<stride::protocol::RunRequest> parse_and_validate(int argc, char* argv[]);

    std::string usage();
}
