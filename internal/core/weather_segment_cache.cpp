#include "weather_segment_cache.hpp"

#include <google/protobuf/util/json_util.h>

#include <future>
#include <map>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace roadcast::core {

using roadcast::core::v1::WeatherPayload;
using roadcast::core::v1::WeatherSegment;
using roadcast::observability::StringField;

namespace {

std::string EncodePayload(const WeatherPayload& payload) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(payload, &json);
  if (!status.ok()) {
    throw std::runtime_error("encode weather payload: " + std::string(status.message()));
  }
  return json;
}

void Fill(WeatherSegment& segment, const std::exception& e, roadcast::core::v1::ErrorKind kind) {
  segment.set_error_kind(kind);
  segment.set_error(e.what());
}

} // namespace

WeatherSegmentCache::WeatherSegmentCache(std::shared_ptr<spatial::SpatialCellIndex> index, std::shared_ptr<cache::TieredCache> cache,
                                         std::shared_ptr<cache::DedupGate> gate, std::shared_ptr<providers::WeatherProvider> provider,
                                         config::WeatherOptions options, config::GateOptions gate_options,
                                         std::chrono::milliseconds stale_grace)
    : index_(std::move(index)),
      cache_(std::move(cache)),
      gate_(std::move(gate)),
      provider_(std::move(provider)),
      options_(std::move(options)),
      gate_options_(gate_options),
      stale_grace_(stale_grace),
      default_zone_(cache::TemporalCacheKey::LoadZone(options_.default_time_zone)),
      generation_(options_.initial_generation),
      pool_(options_.max_parallel_fetches) {
}

std::string WeatherSegmentCache::Generation() const {
  std::lock_guard lock(generation_mutex_);
  return generation_;
}

void WeatherSegmentCache::ObserveModelRun(const std::string& model_run) {
  if (model_run.empty()) return;

  std::string previous;
  {
    std::lock_guard lock(generation_mutex_);
    if (model_run == generation_) return;
    previous    = generation_;
    generation_ = model_run;
  }

  model_refreshes_++;
  ROADCAST_LOG_INFO("weather model generation advanced", {StringField("from", previous), StringField("to", model_run)});
}

std::optional<WeatherResult> WeatherSegmentCache::Decode(spatial::CellId cell, const cache::CacheEntry& entry, bool stale) const {
  WeatherResult result;
  result.cell  = cell;
  result.stale = stale;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  auto status = google::protobuf::util::JsonStringToMessage(entry.payload, &result.payload, options);
  if (!status.ok()) {
    ROADCAST_LOG_WARN("discarding undecodable weather entry", {StringField("key", entry.key), StringField("error", std::string(status.message()))});
    return std::nullopt;
  }
  return result;
}

WeatherResult WeatherSegmentCache::FetchAndStore(spatial::CellId cell, util::TimePoint forecast, const absl::TimeZone& zone,
                                                 const std::string& gate_key, bool store) {
  auto&      metrics = observability::Metrics::Instance();
  const auto center  = index_->Center(cell);

  observability::SpanScope span("roadcast.weather.fetch");
  span.SetAttribute("weather.key", gate_key);
  span.SetCoordinate("weather.cell", center.lat, center.lon);
  span.SetAttribute("weather.store", store);

  WeatherPayload payload;
  try {
    provider_calls_++;
    payload = provider_->Fetch(center, forecast, options_.provider_timeout);
    metrics.RecordProviderCall("weather", true);
  } catch (const util::ProviderUnavailable& e) {
    provider_failures_++;
    metrics.RecordProviderCall("weather", false);
    ROADCAST_LOG_WARN("weather provider failed", {StringField("key", gate_key), StringField("error", e.what())});

    if (auto stale = cache_->GetStale(gate_key, stale_grace_)) {
      if (auto decoded = Decode(cell, *stale, true)) {
        stale_serves_++;
        metrics.RecordStaleServe("weather");
        span.SetAttribute("weather.stale", true);
        ROADCAST_LOG_WARN("serving stale weather", {StringField("key", gate_key)});
        return *decoded;
      }
    }
    throw;
  }

  const auto now        = util::Now();
  const auto expires_at = cache::TemporalCacheKey::ExpiresAt(forecast, zone);
  *payload.mutable_cached_at()     = util::ToProto(now);
  *payload.mutable_expires_at()    = util::ToProto(expires_at);
  *payload.mutable_forecast_time() = util::ToProto(forecast);

  ObserveModelRun(payload.model_run());

  const auto ttl = cache::TemporalCacheKey::Ttl(forecast, zone, now);
  if (store && ttl.count() > 0) {
    cache::CacheEntry entry;
    entry.payload    = EncodePayload(payload);
    entry.created_at = now;
    entry.expires_at = expires_at;
    entry.generation = Generation();

    // Followers are parked on gate_key; a new generation also gets its own key.
    entry.key = gate_key;
    cache_->Put(entry, ttl, true);

    auto current_key = cache::TemporalCacheKey::Build(cell, forecast, entry.generation, zone);
    if (current_key != gate_key) {
      entry.key = std::move(current_key);
      cache_->Put(entry, ttl, true);
    }
  }

  return WeatherResult{cell, std::move(payload), false};
}

WeatherResult WeatherSegmentCache::Get(const spatial::Coordinate& coord, util::TimePoint forecast_time, const std::string& time_zone) {
  const auto zone = time_zone.empty() ? default_zone_ : cache::TemporalCacheKey::LoadZone(time_zone);
  const auto cell = index_->Encode(coord);
  const auto key  = cache::TemporalCacheKey::Build(cell, forecast_time, Generation(), zone);

  if (cache::TemporalCacheKey::IsPastHour(forecast_time, zone, util::Now())) {
    return FetchAndStore(cell, forecast_time, zone, key, false);
  }

  return cache::ReadThrough(
      *gate_, key, gate_options_,
      [&]() -> std::optional<WeatherResult> {
        auto entry = cache_->Get(key);
        if (!entry) return std::nullopt;
        return Decode(cell, *entry, false);
      },
      [&]() { return FetchAndStore(cell, forecast_time, zone, key, true); });
}

std::vector<WeatherSegment> WeatherSegmentCache::GetMany(const std::vector<WeatherQuery>& queries) {
  std::vector<WeatherSegment> segments(queries.size());

  // (cell, hour slot start) -> indices of the queries it answers
  std::map<std::pair<spatial::CellId, std::int64_t>, std::vector<std::size_t>> groups;
  for (std::size_t i = 0; i < queries.size(); ++i) {
    const auto& q = queries[i];
    *segments[i].mutable_forecast_time() = util::ToProto(q.forecast_time);
    try {
      const auto zone = q.time_zone.empty() ? default_zone_ : cache::TemporalCacheKey::LoadZone(q.time_zone);
      const auto cell = index_->Encode(q.coord);
      const auto slot = cache::TemporalCacheKey::SlotOf(q.forecast_time, zone);
      groups[{cell, util::ToUnixMillis(slot.start)}].push_back(i);
    } catch (const util::Invalid& e) {
      Fill(segments[i], e, roadcast::core::v1::ERROR_KIND_INVALID);
    }
  }

  std::vector<std::pair<std::future<WeatherResult>, const std::vector<std::size_t>*>> pending;
  pending.reserve(groups.size());
  for (const auto& [group, members] : groups) {
    const auto& q = queries[members.front()];
    pending.emplace_back(pool_.Submit([this, q] { return Get(q.coord, q.forecast_time, q.time_zone); }), &members);
  }

  for (auto& [future, members] : pending) {
    try {
      const auto result = future.get();
      for (auto i : *members) {
        segments[i] = ToSegment(result, queries[i].forecast_time);
      }
    } catch (const util::ProviderUnavailable& e) {
      for (auto i : *members) Fill(segments[i], e, roadcast::core::v1::ERROR_KIND_PROVIDER_UNAVAILABLE);
    } catch (const util::Invalid& e) {
      for (auto i : *members) Fill(segments[i], e, roadcast::core::v1::ERROR_KIND_INVALID);
    } catch (const std::exception& e) {
      ROADCAST_LOG_ERROR("weather segment failed", {StringField("error", e.what())});
      for (auto i : *members) Fill(segments[i], e, roadcast::core::v1::ERROR_KIND_INTERNAL);
    }
  }

  return segments;
}

WeatherSegment WeatherSegmentCache::ToSegment(const WeatherResult& result, util::TimePoint forecast_time) const {
  WeatherSegment segment;
  const auto     center = index_->Center(result.cell);
  segment.set_cell(spatial::SpatialCellIndex::ToString(result.cell));
  segment.mutable_center()->set_lat(center.lat);
  segment.mutable_center()->set_lon(center.lon);
  *segment.mutable_forecast_time() = util::ToProto(forecast_time);
  *segment.mutable_weather()       = result.payload;
  segment.set_stale(result.stale);
  return segment;
}

WeatherCounters WeatherSegmentCache::Stats() const {
  WeatherCounters out;
  out.provider_calls    = provider_calls_.load();
  out.provider_failures = provider_failures_.load();
  out.stale_serves      = stale_serves_.load();
  out.model_refreshes   = model_refreshes_.load();
  out.generation        = Generation();
  return out;
}

} // namespace roadcast::core
