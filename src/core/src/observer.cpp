#include "../include/nego_observer.hpp"

#include <sstream>

namespace nego {

LayoutObserver& null_observer() {
    static LayoutObserver observer;
    return observer;
}

void LoggingObserver::on_positions(const SuitePositions& sp) {
    if (!Logger::instance().enabled(LogLevel::TRACE)) return;

    std::ostringstream oss;
    oss << "Suite " << sp.suite->name() << " positions:";
    for (int i = 0; i < sp.levels(); ++i) {
        oss << "\n  " << i << ": idx " << sp.slot_index(i) << "/"
            << SuitePositions::slots_at(i) << " pos " << sp.offsets[i];
    }
    NEGO_LOG_TRACE(oss.str());
}

void LoggingObserver::on_suite_begin(const SuitePositions& sp) {
    NEGO_LOG_DEBUG("max " + std::to_string(sp.max) + ": " + sp.suite->name());
}

void LoggingObserver::on_attempt(const ReservationNode& node, bool reserved) {
    NEGO_LOG_TRACE("try insert " + node.suite + ":" + std::to_string(node.level) +
                   " at " + std::to_string(node.range.lo) + "-" +
                   std::to_string(node.range.hi) + (reserved ? " ok" : " blocked"));
}

void LoggingObserver::on_suite_placed(const std::string& suite, int chosen, int top) {
    NEGO_LOG_DEBUG(suite + " levels " + std::to_string(chosen) + "-" + std::to_string(top));
}

void LoggingObserver::on_placement_failed(const std::string& suite) {
    NEGO_LOG_WARN("no viable position for ciphersuite " + suite);
}

void LoggingObserver::on_header_length(size_t len) {
    NEGO_LOG_DEBUG("hdrlen " + std::to_string(len));
}

void LoggingObserver::on_layout_dump(const std::string& phase,
                                     const std::vector<ReservationNode>& nodes) {
    if (!Logger::instance().enabled(LogLevel::DEBUG)) return;

    std::ostringstream oss;
    oss << phase << " point layout:";
    for (const auto& n : nodes) {
        oss << "\n  [" << n.range.lo << "," << n.range.hi << ") "
            << n.suite << ":" << n.level << " tag " << n.tag;
    }
    NEGO_LOG_DEBUG(oss.str());
}

} // namespace nego
