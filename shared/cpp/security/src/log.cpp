#include "../include/log.hpp"
#include <iostream>
#include <mutex>

namespace {
std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}
}

void log_info(const std::string& tag, const std::string& msg) {
    std::lock_guard<std::mutex> lk(log_mutex());
    std::cout << "[" << tag << "] " << msg << std::endl;
}

void log_error(const std::string& tag, const std::string& msg) {
    std::lock_guard<std::mutex> lk(log_mutex());
    std::cerr << "[" << tag << "] " << msg << std::endl;
}
