#ifndef ERRORS_HPP
#define ERRORS_HPP
#include <stdexcept>
#include <string>

// Arm index outside [0, K) handed to a policy.
struct InvalidArmIndex : std::out_of_range
{
    InvalidArmIndex(const std::string &msg) : std::out_of_range(msg) {}
};

// Bad arm set, epsilon, trial count or driver option.
struct InvalidConfiguration : std::invalid_argument
{
    InvalidConfiguration(const std::string &msg) : std::invalid_argument(msg) {}
};

// Reporter could not persist its output.
struct ReportError : std::runtime_error
{
    ReportError(const std::string &msg) : std::runtime_error(msg) {}
};

inline void require(bool cond, const std::string &err)
{
    if (!cond)
    {
        throw InvalidConfiguration(err);
    }
}
#endif
