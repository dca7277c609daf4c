#include "collectors/NetCollector.hpp"
#include "util/Procfs.hpp"
#include <algorithm>
#include <sstream>

namespace rtop::collectors {

using rtop::model::NetIf;
using rtop::model::NetSnapshot;
using rtop::model::UnavailableReason;
using rtop::model::unavailable;

bool is_virtual_interface(const std::string& name) {
  return name == "lo" || name.rfind("veth", 0) == 0 || name.rfind("docker", 0) == 0 ||
         name.rfind("br-", 0) == 0 || name.rfind("virbr", 0) == 0;
}

rtop::model::Reading<NetSnapshot> NetCollector::sample(std::chrono::milliseconds) {
  return sample_at(std::chrono::steady_clock::now());
}

rtop::model::Reading<NetSnapshot> NetCollector::sample_at(std::chrono::steady_clock::time_point now) {
  auto txt_opt = rtop::util::read_file_string("/proc/net/dev");
  if (!txt_opt) return unavailable(UnavailableReason::ReadFailed, "/proc/net/dev");
  double dt = last_ts_ ? std::chrono::duration<double>(now - *last_ts_).count() : 0.0;

  NetSnapshot out{};
  std::unordered_map<std::string, Counters> seen;
  std::istringstream ss(*txt_opt);
  std::string line; int line_no = 0;
  while (std::getline(ss, line)) {
    if (++line_no <= 2) continue; // headers
    auto colon = line.find(':'); if (colon == std::string::npos) continue;
    std::string name = line.substr(0, colon);
    while (!name.empty() && name.front() == ' ') name.erase(name.begin());
    if (name.empty() || is_virtual_interface(name)) continue;
    // rx bytes is the 1st field, tx bytes the 9th
    std::istringstream ns(line.substr(colon + 1));
    uint64_t rx = 0, tx = 0, skip = 0;
    if (!(ns >> rx)) continue;
    for (int i = 0; i < 7; ++i) ns >> skip;
    if (!(ns >> tx)) continue;

    NetIf nif; nif.name = name; nif.rx_total = rx; nif.tx_total = tx;
    if (auto it = last_.find(name); it != last_.end() && dt > 0.0) {
      nif.rx_delta = counter_delta(it->second.rx, rx);
      nif.tx_delta = counter_delta(it->second.tx, tx);
      nif.rx_bps = counter_rate(it->second.rx, rx, dt);
      nif.tx_bps = counter_rate(it->second.tx, tx, dt);
    }
    out.agg_rx_bps += nif.rx_bps; out.agg_tx_bps += nif.tx_bps;
    seen[name] = Counters{rx, tx};
    out.interfaces.push_back(std::move(nif));
  }
  std::sort(out.interfaces.begin(), out.interfaces.end(), [](const NetIf& a, const NetIf& b){ return a.name < b.name; });
  last_ = std::move(seen);
  last_ts_ = now;
  return out;
}

} // namespace rtop::collectors
