#pragma once

#include <echodata/combine.h>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <filesystem>
#include <fstream>
#include <numeric>
#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

// Integer array from a list, e.g. time stamps
auto toArray(const std::vector<int64_t>& values) -> ArrayXl
{
    ArrayXl arr(values.size());
    for (int i {}; i < static_cast<int>(values.size()); ++i) {
        arr(i) = values[i];
    }
    return arr;
}

auto toVector(const ArrayXl& arr) -> std::vector<int64_t>
{
    return { arr.begin(), arr.end() };
}

// Time coordinate of one dimension, by default ping_time
auto timeVariable(const std::vector<int64_t>& time,
                  const std::string& dim = "ping_time") -> echomerge::Variable
{
    echomerge::Variable var {};
    var.dims = { dim };
    var.values = toArray(time);
    var.attrs = { { "long_name", "timestamp of each ping" },
                  { "units", "nanoseconds since 1970-01-01T00:00:00Z" } };
    var.dtype = echomerge::DType::i64;
    return var;
}

// Dataset with dimensions channel and ping_time. Data values are
// 100 * channel + ping index plus offset.
auto makeBeam(const std::vector<int64_t>& ping_time,
              const echomerge::Attrs& attrs = {},
              const size_t n_channels = 2,
              const double offset = 0.0) -> std::unique_ptr<echomerge::Dataset>
{
    auto beam { echomerge::memoryBackend().create() };
    const size_t n_pings { ping_time.size() };
    beam->addDim("channel", n_channels);
    beam->addDim("ping_time", n_pings);
    std::vector<std::string> channels {};
    for (size_t i {}; i < n_channels; ++i) {
        channels.push_back("GPT 38 kHz 00907208a" + std::to_string(i));
    }
    echomerge::Variable channel {};
    channel.dims = { "channel" };
    channel.values = channels;
    channel.dtype = echomerge::DType::str;
    beam->setVariable("channel", channel);
    beam->setVariable("ping_time", timeVariable(ping_time));
    Eigen::ArrayXd backscatter(n_channels * n_pings);
    for (size_t i {}; i < n_channels; ++i) {
        for (size_t j {}; j < n_pings; ++j) {
            backscatter(i * n_pings + j) = 100.0 * i + j + offset;
        }
    }
    echomerge::Variable backscatter_r {};
    backscatter_r.dims = { "channel", "ping_time" };
    backscatter_r.values = backscatter;
    backscatter_r.attrs = { { "long_name", "raw backscatter power" },
                            { "units", "dB" } };
    backscatter_r.dtype = echomerge::DType::f32;
    beam->setVariable("backscatter_r", backscatter_r);
    beam->setAttrs(attrs);
    return beam;
}

// Dataset with sound speed over ping_time
auto makeEnvironment(const std::vector<int64_t>& ping_time)
  -> std::unique_ptr<echomerge::Dataset>
{
    auto environment { echomerge::memoryBackend().create() };
    environment->addDim("ping_time", ping_time.size());
    environment->setVariable("ping_time", timeVariable(ping_time));
    echomerge::Variable sound_speed {};
    sound_speed.dims = { "ping_time" };
    sound_speed.values = Eigen::ArrayXd { Eigen::ArrayXd::Constant(
      static_cast<Eigen::Index>(ping_time.size()), 1500.0) };
    sound_speed.attrs = { { "units", "m/s" } };
    environment->setVariable("sound_speed_indicative", sound_speed);
    environment->setAttrs({ { "long_name", "environment" } });
    return environment;
}

// Dataset with positions over location_time and a scalar
// water_level
auto makePlatform(const std::vector<int64_t>& location_time,
                  const double water_level)
  -> std::unique_ptr<echomerge::Dataset>
{
    auto platform { echomerge::memoryBackend().create() };
    platform->addDim("location_time", location_time.size());
    platform->setVariable("location_time",
                          timeVariable(location_time, "location_time"));
    echomerge::Variable latitude {};
    latitude.dims = { "location_time" };
    latitude.values = Eigen::ArrayXd { Eigen::ArrayXd::LinSpaced(
      static_cast<Eigen::Index>(location_time.size()), 52.0, 53.0) };
    latitude.attrs = { { "units", "degrees_north" } };
    platform->setVariable("latitude", latitude);
    echomerge::Variable level {};
    level.values = Eigen::ArrayXd { Eigen::ArrayXd::Constant(1, water_level) };
    platform->setVariable("water_level", level);
    platform->setAttrs({ { "platform_name", "RV Example" } });
    return platform;
}

// Per channel calibration data, without any time dimension
auto makeVendor(const double gain) -> std::unique_ptr<echomerge::Dataset>
{
    auto vendor { echomerge::memoryBackend().create() };
    vendor->addDim("channel", 2);
    echomerge::Variable gain_correction {};
    gain_correction.dims = { "channel" };
    gain_correction.values =
      Eigen::ArrayXd { Eigen::ArrayXd::Constant(2, gain) };
    vendor->setVariable("gain_correction", gain_correction);
    return vendor;
}

// Record with all groups except beam_power. The provenance group is
// filled with stale contents that combining must replace.
auto makeRecord(const std::optional<echomerge::SonarModel> model,
                const std::string& origin,
                const std::vector<int64_t>& ping_time,
                const echomerge::Attrs& beam_attrs = {}) -> echomerge::EchoData
{
    echomerge::EchoData record {};
    record.sonar_model = model;
    record.source_file = origin;

    auto top { echomerge::memoryBackend().create() };
    top->setAttrs(
      { { "keywords",
          model ? echomerge::sonarModelToString(*model) : "unknown" },
        { "title", "record from " + origin } });
    record.setGroup(echomerge::Group::top, std::move(top));

    record.setGroup(echomerge::Group::environment, makeEnvironment(ping_time));

    std::vector<int64_t> location_time {};
    for (const int64_t time : ping_time) {
        location_time.push_back(time + 5);
    }
    record.setGroup(echomerge::Group::platform,
                    makePlatform(location_time, 1.5));

    auto provenance { echomerge::assembleProvenance(
      { "stale.raw" }, { "some_converter", "0.1" }) };
    record.setGroup(echomerge::Group::provenance, std::move(provenance));

    auto sonar { echomerge::memoryBackend().create() };
    sonar->setAttrs({ { "sonar_manufacturer", "Simrad" },
                      { "sonar_serial_number", origin } });
    record.setGroup(echomerge::Group::sonar, std::move(sonar));

    record.setGroup(echomerge::Group::beam, makeBeam(ping_time, beam_attrs));
    record.setGroup(echomerge::Group::vendor, makeVendor(1.0));
    return record;
}

// Copy a record with one group replaced
auto withGroup(const echomerge::EchoData& record,
               const echomerge::Group group,
               std::shared_ptr<const echomerge::Dataset> dataset)
  -> echomerge::EchoData
{
    echomerge::EchoData copy { record };
    copy.setGroup(group, std::move(dataset));
    return copy;
}

// Collects messages sent to the default logger while in scope
class LogCapture
{
private:
    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink {
        std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(256)
    };
    std::shared_ptr<spdlog::logger> previous { spdlog::default_logger() };

public:
    LogCapture()
    {
        auto logger { std::make_shared<spdlog::logger>("capture", sink) };
        logger->set_pattern("%l: %v");
        logger->set_level(spdlog::level::debug);
        spdlog::set_default_logger(logger);
    }
    // Number of messages of a given level containing text
    [[nodiscard]] auto count(const spdlog::level::level_enum level,
                             const std::string& text) const -> size_t
    {
        const auto name { spdlog::level::to_string_view(level) };
        const std::string prefix { std::string(name.data(), name.size())
                                   + ": " };
        size_t n {};
        for (const auto& msg : sink->last_formatted()) {
            if (msg.starts_with(prefix)
                && msg.find(text) != std::string::npos) {
                ++n;
            }
        }
        return n;
    }
    ~LogCapture() { spdlog::set_default_logger(previous); }
};
