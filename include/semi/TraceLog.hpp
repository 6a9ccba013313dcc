// =============================================================================
// include/semi/TraceLog.hpp - 迭代过程事件记录
// =============================================================================
#ifndef SEMI_TRACE_LOG_HPP
#define SEMI_TRACE_LOG_HPP

#include <string>
#include <utility>
#include <vector>

/** 一条迭代事件：kind 取 "iteration" | "accept" | "reject" | "warning" | "final" */
struct TraceEvent {
    std::string engine;
    int         iteration = 0;
    std::string kind;
    std::string message;
    std::vector<std::pair<std::string, double>> values;

    bool   has(const std::string& key) const;
    /** 未找到 key 时返回 fallback */
    double value(const std::string& key, double fallback = 0.0) const;
};

/**
 * 由调用方持有、以指针传给 fit 的事件汇
 * echo=true 时每条事件同时打印到 std::cout
 */
class TraceLog {
public:
    explicit TraceLog(bool echo = false) : echo_(echo) {}

    void append(TraceEvent event);

    void record(const std::string& engine,
                int iteration,
                const std::string& kind,
                const std::string& message,
                std::vector<std::pair<std::string, double>> values = {});

    const std::vector<TraceEvent>& events() const { return events_; }

    std::vector<TraceEvent> filter(const std::string& kind) const;
    size_t count(const std::string& kind) const;

    void clear() { events_.clear(); }

private:
    bool echo_;
    std::vector<TraceEvent> events_;
};

#endif // SEMI_TRACE_LOG_HPP
