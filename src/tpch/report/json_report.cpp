#include "tpch/report/json_report.h"
#include "tpch/common/logger.h"

#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include <fstream>

namespace tpch {
namespace report {

namespace {

rapidjson::Value Timings(const core::TimingSample& sample, rapidjson::Document::AllocatorType& allocator) {
    rapidjson::Value out(rapidjson::kObjectType);

    rapidjson::Value queries(rapidjson::kArrayType);
    for (const auto& q : sample.query_times) {
        if (q) {
            queries.PushBack(q->count(), allocator);
        } else {
            queries.PushBack(rapidjson::Value(rapidjson::kNullType), allocator);
        }
    }
    out.AddMember("queries", queries, allocator);

    rapidjson::Value refresh(rapidjson::kArrayType);
    for (const auto& r : sample.refresh_times) {
        if (r) {
            refresh.PushBack(r->count(), allocator);
        } else {
            refresh.PushBack(rapidjson::Value(rapidjson::kNullType), allocator);
        }
    }
    out.AddMember("refresh", refresh, allocator);
    return out;
}

} // namespace

std::string to_json(const core::Metrics& metrics,
                    const core::TimingSample& power_sample,
                    const std::vector<core::TimingSample>& throughput_samples,
                    uint32_t query_streams) {
    rapidjson::Document doc;
    doc.SetObject();
    auto& allocator = doc.GetAllocator();

    doc.AddMember("scale_factor", metrics.scale_factor, allocator);
    doc.AddMember("query_streams", query_streams, allocator);
    doc.AddMember("power_at_size", metrics.power, allocator);
    doc.AddMember("throughput_at_size", metrics.throughput, allocator);
    doc.AddMember("qphh_at_size", metrics.qphh, allocator);
    doc.AddMember("power", Timings(power_sample, allocator), allocator);

    rapidjson::Value streams(rapidjson::kArrayType);
    for (const auto& sample : throughput_samples) {
        rapidjson::Value entry(rapidjson::kObjectType);
        entry.AddMember("mode", rapidjson::StringRef(core::StreamModeName(sample.mode)), allocator);
        entry.AddMember("stream", sample.stream, allocator);
        if (sample.start && sample.end) {
            entry.AddMember("elapsed", core::Seconds(*sample.end - *sample.start).count(), allocator);
        } else {
            entry.AddMember("elapsed", rapidjson::Value(rapidjson::kNullType), allocator);
        }
        streams.PushBack(entry, allocator);
    }
    doc.AddMember("streams", streams, allocator);

    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);
    return buffer.GetString();
}

core::Result<void> write_json(const std::string& path,
                              const core::Metrics& metrics,
                              const core::TimingSample& power_sample,
                              const std::vector<core::TimingSample>& throughput_samples,
                              uint32_t query_streams) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        return core::Result<void>::error("cannot open report file: " + path, core::Error::Code::NOT_FOUND);
    }
    out << to_json(metrics, power_sample, throughput_samples, query_streams) << '\n';
    out.close();
    if (out.fail()) {
        return core::Result<void>::error("failed writing report file: " + path, core::Error::Code::INTERNAL);
    }
    TPCH_INFO("wrote report to {}", path);
    return core::Result<void>();
}

} // namespace report
} // namespace tpch
