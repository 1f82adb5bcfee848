#include <logrotor/logrotor.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

using namespace logrotor;

int main()
{
    // Run one pass over a scratch directory through the installed header
    namespace fs    = std::filesystem;
    std::string dir = "/tmp/logrotor_integration_" + std::to_string(::getpid());
    fs::create_directories(dir);

    {
        std::ofstream out(dir + "/app.log");
        out << "Integration test successful!\n";
    }

    fd_reporter reporter(STDERR_FILENO, log_level::info, "integ");
    log_rotate(dir, 0, 1, reporter);

    std::error_code ec;
    auto archives = filter_file_list(dir, rotated_file_pattern("app.log", rotate_stage::backup), ec);
    bool ok       = !ec && archives.size() == 1 && fs::file_size(dir + "/app.log") == 0;

    fs::remove_all(dir, ec);
    std::printf("%s\n", ok ? "Integration test successful!" : "Integration test FAILED");
    return ok ? 0 : 1;
}
