#include <querygraph/core/terminal.hpp>

#include <cstdio>
#include <cstdlib>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace querygraph {

bool IsTerminal(OutputStream stream) {
#ifdef _WIN32
    FILE* file = stream == OutputStream::Stdout ? stdout : stderr;
    return _isatty(_fileno(file)) != 0;
#else
    const int fd = stream == OutputStream::Stdout ? STDOUT_FILENO : STDERR_FILENO;
    return isatty(fd) != 0;
#endif
}

bool NoColorEnvSet() {
    const char* value = std::getenv("NO_COLOR");
    return value != nullptr && *value != '\0';
}

bool ColorEnabled(OutputStream stream, std::optional<bool> explicit_choice) {
    if (NoColorEnvSet()) {
        return false;
    }
    if (explicit_choice.has_value()) {
        return *explicit_choice;
    }
    return IsTerminal(stream);
}

} // namespace querygraph
