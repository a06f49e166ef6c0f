#ifndef TEST_UTILS_HPP
#define TEST_UTILS_HPP
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

// Logger that writes bare messages into out. Not registered globally.
inline std::shared_ptr<spdlog::logger> capture_logger(std::ostringstream &out)
{
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    auto logger = std::make_shared<spdlog::logger>("test", sink);
    logger->set_pattern("%v");
    logger->set_level(spdlog::level::debug);
    return logger;
}

// Fresh directory under the system temp dir, removed on destruction.
struct ScratchDir
{
    std::filesystem::path path;

    ScratchDir(const std::string &tag)
    {
        path = std::filesystem::temp_directory_path() /
               ("mab_test_" + tag + "_" + std::to_string(reinterpret_cast<std::uintptr_t>(this)));
        std::filesystem::remove_all(path);
        std::filesystem::create_directories(path);
    }
    ~ScratchDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
    std::string file(const std::string &name) const { return (path / name).string(); }
};

inline std::vector<std::string> read_lines(const std::string &path)
{
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line))
    {
        lines.push_back(line);
    }
    return lines;
}
#endif
