#include "advisory_lock.hpp"
#include <core/utils.hpp>
#include <fstream>
#include <iterator>
#include <string>

AdvisoryLock::AdvisoryLock(std::filesystem::path lock_path)
    : path_(std::move(lock_path)) {}

AdvisoryLock::~AdvisoryLock() {
    release();
}

std::optional<long> read_lock_owner(const std::filesystem::path& lock_path) {
    std::ifstream in(lock_path);
    if (!in) return std::nullopt;

    std::string content((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());
    auto pid = parse_int_strict(content);
    if (!pid || *pid <= 0) return std::nullopt;
    return pid;
}
