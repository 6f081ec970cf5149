#include "Metrics.h"

namespace observability {

static const std::vector<double> buckets = {1,2,5,10,20,50,100,200,500,1000,2000,5000};
static const std::vector<int> attempt_buckets = {1,2,3,5,10,20,50};

Metrics& Metrics::instance() {
    static Metrics m;
    return m;
}

Metrics::Metrics() {}

void Metrics::inc(const std::string& path, const std::string& method, int code) {
    MetricsKey k{path, method, code};
    std::lock_guard lock(mu_);
    auto it = map_.find(k);
    if (it == map_.end()) map_.emplace(k, 1);
    else it->second += 1;
}

void Metrics::observe_latency(const std::string& path, const std::string& method, double latency_ms) {
    MetricsKey k{path, method, 0};
    std::lock_guard lock(mu_);
    auto it = hist_.find(k);
    if (it == hist_.end()) {
        HistData h;
        h.buckets.assign(buckets.size(), 0);
        h.sum = latency_ms;
        h.count = 1;
        for (size_t i = 0; i < buckets.size(); ++i) { if (latency_ms <= buckets[i]) { h.buckets[i] = 1; } }
        hist_.emplace(k, std::move(h));
        return;
    }
    auto& h = it->second;
    h.count += 1;
    h.sum += latency_ms;
    for (size_t i = 0; i < buckets.size(); ++i) { if (latency_ms <= buckets[i]) { h.buckets[i] += 1; } }
}

void Metrics::inc_registration(const std::string& op, const std::string& outcome) {
    std::lock_guard lock(mu_);
    registrations_[op + "|" + outcome] += 1;
}

void Metrics::inc_commit_conflict() {
    std::lock_guard lock(mu_);
    commit_conflicts_ += 1;
}

void Metrics::observe_attempts(const std::string& op, int attempts) {
    std::lock_guard lock(mu_);
    auto& h = attempts_[op];
    if (h.buckets.empty()) h.buckets.assign(attempt_buckets.size(), 0);
    h.count += 1;
    h.sum += attempts;
    for (size_t i = 0; i < attempt_buckets.size(); ++i) {
        if (attempts <= attempt_buckets[i]) h.buckets[i] += 1;
    }
}

uint64_t Metrics::attempts_within(const std::string& op, int le) const {
    std::lock_guard lock(mu_);
    auto it = attempts_.find(op);
    if (it == attempts_.end()) return 0;
    for (size_t i = 0; i < attempt_buckets.size(); ++i) {
        if (attempt_buckets[i] == le) return it->second.buckets[i];
    }
    return 0;
}

uint64_t Metrics::registration_count(const std::string& op, const std::string& outcome) const {
    std::lock_guard lock(mu_);
    auto it = registrations_.find(op + "|" + outcome);
    return it == registrations_.end() ? 0 : it->second;
}

uint64_t Metrics::commit_conflicts() const {
    std::lock_guard lock(mu_);
    return commit_conflicts_;
}

std::string Metrics::scrape() const {
    std::ostringstream ss;
    ss << "# HELP http_requests_total Total HTTP requests\n";
    ss << "# TYPE http_requests_total counter\n";
    std::lock_guard lock(mu_);
    for (const auto& p : map_) {
        ss << "http_requests_total{path=\"" << p.first.path << "\",method=\"" << p.first.method << "\",code=\"" << p.first.code << "\"} " << p.second << "\n";
    }
    ss << "# HELP http_request_duration_ms Histogram of request durations\n";
    ss << "# TYPE http_request_duration_ms histogram\n";
    for (const auto& p : hist_) {
        const auto& k = p.first;
        const auto& h = p.second;
        for (size_t i = 0; i < buckets.size(); ++i) {
            ss << "http_request_duration_ms_bucket{path=\"" << k.path << "\",method=\"" << k.method << "\",le=\"" << buckets[i] << "\"} " << h.buckets[i] << "\n";
        }
        ss << "http_request_duration_ms_bucket{path=\"" << k.path << "\",method=\"" << k.method << "\",le=\"+Inf\"} " << h.count << "\n";
        ss << "http_request_duration_ms_sum{path=\"" << k.path << "\",method=\"" << k.method << "\"} " << h.sum << "\n";
        ss << "http_request_duration_ms_count{path=\"" << k.path << "\",method=\"" << k.method << "\"} " << h.count << "\n";
    }
    ss << "# HELP registration_ops_total Registration operations by outcome\n";
    ss << "# TYPE registration_ops_total counter\n";
    for (const auto& p : registrations_) {
        auto bar = p.first.find('|');
        ss << "registration_ops_total{op=\"" << p.first.substr(0, bar) << "\",outcome=\"" << p.first.substr(bar + 1) << "\"} " << p.second << "\n";
    }
    ss << "# HELP registration_commit_conflicts_total Roster commits lost to a concurrent writer\n";
    ss << "# TYPE registration_commit_conflicts_total counter\n";
    ss << "registration_commit_conflicts_total " << commit_conflicts_ << "\n";
    ss << "# HELP registration_attempts Attempts per registration call\n";
    ss << "# TYPE registration_attempts histogram\n";
    for (const auto& p : attempts_) {
        const auto& h = p.second;
        for (size_t i = 0; i < attempt_buckets.size(); ++i) {
            ss << "registration_attempts_bucket{op=\"" << p.first << "\",le=\"" << attempt_buckets[i] << "\"} " << h.buckets[i] << "\n";
        }
        ss << "registration_attempts_bucket{op=\"" << p.first << "\",le=\"+Inf\"} " << h.count << "\n";
        ss << "registration_attempts_sum{op=\"" << p.first << "\"} " << h.sum << "\n";
        ss << "registration_attempts_count{op=\"" << p.first << "\"} " << h.count << "\n";
    }
    return ss.str();
}

} 
