#pragma once

#include <exception>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/interrupt.hpp"

namespace cloudstrap::provision {

/*
  Zone-fallback placement shared by compute and database creation.

  Each attempt produces one of three outcomes. Only capacity and invalid-zone
  failures move on to the next zone; anything else ends the loop and is
  rethrown unchanged.
*/

struct Created {
  std::string id;
};

struct Retryable {
  util::ProviderErrorKind kind;
  std::string             code;
};

struct Fatal {
  std::exception_ptr error;
};

using AttemptOutcome = std::variant<Created, Retryable, Fatal>;

struct Placement {
  std::string zone;
  std::string subnet_id;
  std::string id;
};

template <typename CreateFn>
AttemptOutcome Attempt(CreateFn& create, const std::string& zone, const std::string& subnet_id) {
  try {
    return Created{create(zone, subnet_id)};
  } catch (const util::ProviderError& e) {
    if (util::IsZoneRetryable(e.kind())) {
      return Retryable{e.kind(), e.code()};
    }
    return Fatal{std::current_exception()};
  } catch (const std::exception&) {
    return Fatal{std::current_exception()};
  }
}

/*
  Tries `create(zone, subnet_id)` for every zone in `zones` that has a subnet,
  in order. Throws NoZoneAvailable once every zone was rejected as retryable,
  and util::Interrupted before any attempt once an interrupt is pending.
*/
template <typename CreateFn>
Placement PlaceInFirstAvailableZone(std::string_view resource, const std::vector<std::string>& zones,
                                    const std::map<std::string, std::string>& subnets, CreateFn&& create) {
  observability::SpanScope span("provision.placement");
  span.SetAttribute("resource", resource);

  std::string tried;
  for (const auto& zone : zones) {
    util::ThrowIfInterrupted();
    auto subnet = subnets.find(zone);
    if (subnet == subnets.end()) {
      continue;
    }

    AttemptOutcome outcome = Attempt(create, zone, subnet->second);

    if (auto* created = std::get_if<Created>(&outcome)) {
      span.SetAttribute("zone", zone);
      return Placement{zone, subnet->second, std::move(created->id)};
    }
    if (auto* fatal = std::get_if<Fatal>(&outcome)) {
      std::rethrow_exception(fatal->error);
    }

    const auto& retry = std::get<Retryable>(outcome);
    span.AddEvent("zone.rejected", "zone", zone);
    CLOUDSTRAP_LOG_WARN("Zone rejected, trying next", {observability::StringField("resource", resource),
                                                       observability::StringField("zone", zone),
                                                       observability::StringField("kind", util::ToString(retry.kind)),
                                                       observability::StringField("code", retry.code)});
    tried += tried.empty() ? zone : ", " + zone;
  }

  span.RecordException("no zone available");
  throw util::NoZoneAvailable("No zone could place " + std::string(resource) +
                              (tried.empty() ? std::string(" (no zone has a subnet)") : " (tried " + tried + ")"));
}

} // namespace cloudstrap::provision
