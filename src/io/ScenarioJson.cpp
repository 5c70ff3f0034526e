#include "io/ScenarioJson.hpp"
#include "utils/TimeUtils.hpp"

#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace avail {
    namespace {
        template<typename T>
        std::optional<T> optionalValue(const json &j, const char *key) {
            const auto it = j.find(key);
            if (it == j.end() || it->is_null()) return std::nullopt;
            return it->get<T>();
        }

        template<typename T>
        void putOptional(json &j, const char *key, const std::optional<T> &v) {
            if (v) j[key] = *v;
            else j[key] = nullptr;
        }
    } // namespace

    void from_json(const json &j, SpecialRate &r) {
        r.name = j.value("name", std::string{});
        r.rate = j.at("rate").get<double>();
        r.applyDays = optionalValue<std::vector<std::string>>(j, "applyDays");
        r.startTime = j.value("startTime", std::string{});
        r.endTime = j.value("endTime", std::string{});
    }

    void from_json(const json &j, Pricing &p) {
        p.baseHourlyRate = j.value("baseHourlyRate", 30.0);
        p.peakHourRate = optionalValue<double>(j, "peakHourRate");
        p.weekendRate = optionalValue<double>(j, "weekendRate");
        p.memberDiscount = optionalValue<double>(j, "memberDiscount");

        p.specialRates.clear();
        if (const auto it = j.find("specialRates"); it != j.end() && !it->is_null()) {
            // stored either as a list or as a name -> rate map
            if (it->is_object()) {
                for (const auto &[name, rate]: it->items()) {
                    SpecialRate sr = rate.get<SpecialRate>();
                    if (sr.name.empty()) sr.name = name;
                    p.specialRates.push_back(std::move(sr));
                }
            } else {
                p.specialRates = it->get<std::vector<SpecialRate>>();
            }
        }
    }

    void from_json(const json &j, Court &c) {
        c.id = j.at("id").get<std::string>();
        c.venueId = j.at("venueId").get<std::string>();
        c.name = j.value("name", c.id);
        c.status = parse_court_status(j.value("status", std::string{"active"}));
        c.pricing = j.contains("pricing") && !j["pricing"].is_null() ? j["pricing"].get<Pricing>() : Pricing{};
    }

    void from_json(const json &j, Booking &b) {
        b.id = j.at("id").get<std::string>();
        b.userId = j.value("userId", std::string{});
        b.courtId = j.at("courtId").get<std::string>();
        b.venueId = j.value("venueId", std::string{});
        b.date = j.value("date", std::string{});
        b.startTime = j.at("startTime").get<std::string>();
        b.endTime = j.at("endTime").get<std::string>();
        b.status = parse_booking_status(j.value("status", std::string{"confirmed"}));
    }

    void from_json(const json &j, VenueSettings &s) {
        s.bookingFlow = optionalValue<std::string>(j, "bookingFlow");
    }

    void from_json(const json &j, DayHours &h) {
        h.open = j.at("open").get<std::string>();
        h.close = j.at("close").get<std::string>();
    }

    void from_json(const json &j, Venue &v) {
        v.id = j.at("id").get<std::string>();
        v.name = j.value("name", v.id);
        v.settings = optionalValue<VenueSettings>(j, "settings");

        // weekday name -> { open, close } | null; a day that is not listed is closed
        v.operatingHours.reset();
        if (const auto it = j.find("operatingHours"); it != j.end() && !it->is_null()) {
            WeeklyHours week;
            for (std::size_t d = 0; d < kWeekdayNames.size(); ++d) {
                week[d] = optionalValue<DayHours>(*it, kWeekdayNames[d]);
            }
            v.operatingHours = week;
        }
    }

    void to_json(json &j, const SpecialRate &r) {
        j = json{{"name", r.name}, {"rate", r.rate}, {"startTime", r.startTime}, {"endTime", r.endTime}};
        putOptional(j, "applyDays", r.applyDays);
    }

    void to_json(json &j, const Pricing &p) {
        j = json{{"baseHourlyRate", p.baseHourlyRate}, {"specialRates", p.specialRates}};
        putOptional(j, "peakHourRate", p.peakHourRate);
        putOptional(j, "weekendRate", p.weekendRate);
        putOptional(j, "memberDiscount", p.memberDiscount);
    }

    void to_json(json &j, const Court &c) {
        j = json{{"id", c.id}, {"venueId", c.venueId}, {"name", c.name},
                 {"status", to_string(c.status)}, {"pricing", c.pricing}};
    }

    void to_json(json &j, const Booking &b) {
        j = json{{"id", b.id}, {"userId", b.userId}, {"courtId", b.courtId}, {"venueId", b.venueId},
                 {"date", b.date}, {"startTime", b.startTime}, {"endTime", b.endTime},
                 {"status", to_string(b.status)}};
    }

    void to_json(json &j, const TimeSlot &s) {
        j = json{{"time", s.time}, {"timeValue", s.timeValue},
                 {"courtAvailability", s.courtAvailability}, {"hasAvailableCourts", s.hasAvailableCourts}};
    }

    void to_json(json &j, const SlotView &v) {
        j = json{{"label", v.label}, {"value", v.value}, {"available", v.available}};
    }

    void to_json(json &j, const TimeSlotStatus &s) {
        j = json{{"time", s.time}, {"timeValue", s.timeValue}, {"availableCourts", s.availableCourts},
                 {"unavailableCourts", s.unavailableCourts}, {"hasAvailableCourts", s.hasAvailableCourts}};
    }

    void to_json(json &j, const Duration &d) {
        j = json{{"label", d.label}, {"value", d.minutes}, {"price", d.price}};
        if (d.courtId) j["courtId"] = *d.courtId;
    }

    void to_json(json &j, const DurationAvailability &d) {
        j = d.duration;
        j["availableCourts"] = d.availableCourts;
        j["unavailableCourts"] = d.unavailableCourts;
        j["hasAvailableCourts"] = !d.availableCourts.empty();
    }

    void to_json(json &j, const CourtAvailabilityStatus &s) {
        j = json{{"courtId", s.courtId}, {"courtName", s.courtName}, {"available", s.available},
                 {"fullyAvailable", s.fullyAvailable}, {"availableTimeSlots", s.availableTimeSlots},
                 {"unavailableTimeSlots", s.unavailableTimeSlots}};
    }

    json snapshotToJson(const AvailabilitySnapshot &snap) {
        json j{
            {"version", snap.version},
            {"date", snap.hasDate() ? formatDate(snap.date) : std::string{}},
            {"venueId", snap.venueId},
            {"venueName", snap.venueName},
            {"timeSlots", snap.timeSlots},
            {"activeCourtIds", snap.activeCourtIds},
            {"bookings", snap.bookings},
            {"flowType", to_string(snap.flowType)},
            {"loading", snap.loading},
            {"errorKind", to_string(snap.errorKind)}
        };
        putOptional(j, "error", snap.error);
        return j;
    }

    Scenario parseScenario(const json &j) {
        if (!j.is_object()) throw std::invalid_argument("scenario must be a JSON object");

        Scenario sc;
        try {
            if (const auto it = j.find("config"); it != j.end()) sc.config = engineConfigFromJson(*it);
            sc.timezone = j.value("timezone", std::string{});
            sc.venues = j.value("venues", std::vector<Venue>{});
            sc.courts = j.value("courts", std::vector<Court>{});
            sc.bookings = j.value("bookings", std::vector<Booking>{});
            sc.members = j.value("members", std::vector<std::string>{});
        } catch (const json::exception &e) {
            throw std::invalid_argument(std::string("bad scenario: ") + e.what());
        }

        // bookings may omit venueId; take it from the court
        for (Booking &b: sc.bookings) {
            if (!b.venueId.empty()) continue;
            for (const Court &c: sc.courts) {
                if (c.id == b.courtId) {
                    b.venueId = c.venueId;
                    break;
                }
            }
        }
        return sc;
    }

    Scenario loadScenarioFile(const std::string &path) {
        std::ifstream in(path);
        if (!in) throw std::runtime_error("cannot open scenario file '" + path + "'");

        json j;
        try {
            in >> j;
        } catch (const json::parse_error &e) {
            throw std::runtime_error("scenario '" + path + "' is not valid JSON: " + e.what());
        }
        return parseScenario(j);
    }
} // namespace avail
