#include "semi/TraceLog.hpp"
#include <algorithm>
#include <iostream>

bool TraceEvent::has(const std::string& key) const {
    return std::any_of(values.begin(), values.end(),
                       [&](const std::pair<std::string, double>& kv) { return kv.first == key; });
}

double TraceEvent::value(const std::string& key, double fallback) const {
    for (const auto& kv : values) {
        if (kv.first == key) return kv.second;
    }
    return fallback;
}

void TraceLog::append(TraceEvent event) {
    if (echo_) {
        std::cout << "[" << event.engine << " #" << event.iteration << "] "
                  << event.kind << ": " << event.message;
        for (const auto& kv : event.values) {
            std::cout << " " << kv.first << "=" << kv.second;
        }
        std::cout << std::endl;
    }
    events_.push_back(std::move(event));
}

void TraceLog::record(const std::string& engine,
                      int iteration,
                      const std::string& kind,
                      const std::string& message,
                      std::vector<std::pair<std::string, double>> values) {
    TraceEvent e;
    e.engine    = engine;
    e.iteration = iteration;
    e.kind      = kind;
    e.message   = message;
    e.values    = std::move(values);
    append(std::move(e));
}

std::vector<TraceEvent> TraceLog::filter(const std::string& kind) const {
    std::vector<TraceEvent> out;
    std::copy_if(events_.begin(), events_.end(), std::back_inserter(out),
                 [&](const TraceEvent& e) { return e.kind == kind; });
    return out;
}

size_t TraceLog::count(const std::string& kind) const {
    return std::count_if(events_.begin(), events_.end(),
                         [&](const TraceEvent& e) { return e.kind == kind; });
}
