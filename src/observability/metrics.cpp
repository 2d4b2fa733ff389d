#include "metrics.hpp"

namespace lanshare {

std::atomic<IMetrics *> g_metrics{nullptr};

} // namespace lanshare
