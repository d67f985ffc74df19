#pragma once

#include <querygraph/core/log.hpp>
#include <querygraph/core/types.hpp>
#include <querygraph/sql/identifier_rewriter.hpp>

#include <optional>
#include <string>

namespace querygraph {

struct AppConfig {
    LogLevel log_level = LogLevel::Warn;
    std::optional<std::string> log_file;
    bool json_output = false;
    std::optional<bool> color;  // unset: decide from the terminal
    bool verbose = false;
    bool quiet = false;
    bool auto_generate = true;
    int debounce_ms = 500;
    OperationMode default_mode = OperationMode::Select;
    LinkedServerMap linked_servers;
};

} // namespace querygraph
