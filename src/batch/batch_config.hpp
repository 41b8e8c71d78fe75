#pragma once

#include "errors.hpp"

#include <chrono>
#include <sstream>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// BatchConfig — worker pool size and the per-symbol fetch policy
// ---------------------------------------------------------------------------
struct BatchConfig {
    int max_workers = 10;
    std::chrono::milliseconds fetch_timeout{30000};
    int max_retries = 2;                          // retries after the first attempt
    std::chrono::milliseconds retry_backoff{1000};

    void validate() const {
        if (max_workers <= 0) {
            throw InvalidConfiguration("max_workers must be > 0, got " +
                                       std::to_string(max_workers));
        }
        if (fetch_timeout.count() <= 0) {
            throw InvalidConfiguration("fetch_timeout must be > 0");
        }
        if (max_retries < 0) {
            throw InvalidConfiguration("max_retries must be >= 0, got " +
                                       std::to_string(max_retries));
        }
        if (retry_backoff.count() < 0) {
            throw InvalidConfiguration("retry_backoff must be >= 0");
        }
    }
};

// Comma-separated symbol list; empty items are dropped.
inline std::vector<std::string> split_symbol_list(const std::string& s) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) out.push_back(item);
    }
    return out;
}
