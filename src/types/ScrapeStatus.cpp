#include "types/ScrapeStatus.hpp"

using namespace kv::types;
using namespace std::chrono;

ScrapeStatus::ScrapeStatus(const int64_t series) : series(series) {}

void ScrapeStatus::setScrapeErr(const system_clock::time_point start,
                                const system_clock::time_point end,
                                const std::string& err) {
    ++scrape_times;
    last_scrape = start;
    last_scrape_duration = duration<double>(end - start).count();
    last_error = err;
    health = err.empty() ? Health::Up : Health::Down;
}
