#include "tracker/ProcUtil.hpp"

#include <cstdio>
#include <sys/wait.h>

namespace procutil {

ProcResult run_capture_stdout(const std::string& cmdline) {
    ProcResult r;

    FILE* pipe = popen(cmdline.c_str(), "r");
    if (!pipe) return r;

    r.output.reserve(8192);

    char buf[4096];
    size_t n = 0;
    while ((n = fread(buf, 1, sizeof(buf), pipe)) > 0) {
        r.output.append(buf, buf + n);
    }

    const int status = pclose(pipe);
    if (status != -1 && WIFEXITED(status)) r.exit_code = WEXITSTATUS(status);

    return r;
}

std::string shell_quote(const std::string& arg) {
    std::string out = "'";
    out.reserve(arg.size() + 2);
    for (char c : arg) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

} // namespace procutil
