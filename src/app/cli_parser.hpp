#pragma once
#include <string>
#include "protocol/run_request.hpp"
#include "core/errors/cortex_errors.hpp"

namespace cortex::app::cli {
    cortex::core::errors::Result<cortex::protocol::RunRequest> parse_and_validate(int argc, char* argv[]);

    std::string usage();
}
