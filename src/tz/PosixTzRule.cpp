#include "tz/PosixTzRule.hpp"

#include <boost/date_time/local_time/local_time.hpp>
#include <boost/make_shared.hpp>

#include <cctype>
#include <stdexcept>
#include <utility>

namespace avail {
    namespace {
        constexpr long kSecondsPerDay = 24 * 3600;

        long floorDiv(long a, long b) {
            long q = a / b;
            if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
            return q;
        }

        class RuleReader {
        public:
            explicit RuleReader(const std::string &text) : s_(text) {}

            [[nodiscard]] bool done() const noexcept { return pos_ >= s_.size(); }
            [[nodiscard]] char peek() const noexcept { return done() ? '\0' : s_[pos_]; }

            bool accept(char c) {
                if (peek() != c) return false;
                ++pos_;
                return true;
            }

            void expect(char c) {
                if (!accept(c)) fail(std::string("expected '") + c + "'");
            }

            /// "CET" or "<+03>"
            std::string abbrev() {
                std::string out;
                if (accept('<')) {
                    while (!done() && peek() != '>') out.push_back(s_[pos_++]);
                    expect('>');
                } else {
                    while (std::isalpha(static_cast<unsigned char>(peek()))) out.push_back(s_[pos_++]);
                }
                if (out.empty()) fail("missing zone abbreviation");
                return out;
            }

            int number(int maxDigits) {
                if (!std::isdigit(static_cast<unsigned char>(peek()))) fail("expected a number");
                int v = 0;
                for (int i = 0; i < maxDigits && std::isdigit(static_cast<unsigned char>(peek())); ++i) {
                    v = v * 10 + (s_[pos_++] - '0');
                }
                return v;
            }

            /// [+-]hh[:mm[:ss]] in seconds; hours up to 167 for transition times.
            long duration() {
                long sign = 1;
                if (accept('-')) sign = -1;
                else accept('+');

                long secs = number(3) * 3600L;
                if (accept(':')) {
                    secs += number(2) * 60L;
                    if (accept(':')) secs += number(2);
                }
                return sign * secs;
            }

            PosixTransition transition() {
                const std::size_t from = pos_;
                PosixTransition t;
                if (accept('M')) {
                    t.kind = PosixTransition::Kind::MonthWeekDay;
                    t.month = number(2);
                    expect('.');
                    t.week = number(1);
                    expect('.');
                    t.weekday = number(1);
                    if (t.month < 1 || t.month > 12 || t.week < 1 || t.week > 5 || t.weekday > 6) {
                        fail("transition out of range");
                    }
                } else if (accept('J')) {
                    t.kind = PosixTransition::Kind::JulianNoLeap;
                    t.day = number(3);
                    if (t.day < 1 || t.day > 365) fail("julian day out of range");
                } else {
                    t.kind = PosixTransition::Kind::ZeroBasedDay;
                    t.day = number(3);
                    if (t.day > 365) fail("day of year out of range");
                }
                if (accept('/')) t.seconds = duration();
                t.text = s_.substr(from, pos_ - from);
                return t;
            }

            [[noreturn]] void fail(const std::string &what) const {
                throw std::invalid_argument("bad TZ rule '" + s_ + "' at " + std::to_string(pos_) + ": " + what);
            }

        private:
            const std::string &s_;
            std::size_t pos_{0};
        };

        /// Calendar side of a transition; the time of day is carried by dst_adjustment_offsets.
        class TransitionDayRule final : public boost::local_time::dst_calc_rule {
        public:
            TransitionDayRule(PosixTransition start, long startShiftDays, PosixTransition end, long endShiftDays)
                : start_(std::move(start)), end_(std::move(end)),
                  start_shift_(startShiftDays), end_shift_(endShiftDays) {
            }

            boost::gregorian::date start_day(boost::gregorian::greg_year y) const override {
                return start_.dateIn(y) + boost::gregorian::days(start_shift_);
            }

            std::string start_rule_as_string() const override { return start_.text; }

            boost::gregorian::date end_day(boost::gregorian::greg_year y) const override {
                return end_.dateIn(y) + boost::gregorian::days(end_shift_);
            }

            std::string end_rule_as_string() const override { return end_.text; }

        private:
            PosixTransition start_;
            PosixTransition end_;
            long start_shift_;
            long end_shift_;
        };
    } // namespace

    boost::gregorian::date PosixTransition::dateIn(int year) const {
        using namespace boost::gregorian;
        const auto y = static_cast<unsigned short>(year);

        switch (kind) {
            case Kind::MonthWeekDay: {
                const greg_weekday wd(static_cast<unsigned short>(weekday));
                const greg_month m(static_cast<unsigned short>(month));
                if (week == 5) return last_kday_of_month(wd, m).get_date(y);
                return nth_kday_of_month(static_cast<nth_kday_of_month::week_num>(week), wd, m).get_date(y);
            }
            case Kind::JulianNoLeap: {
                int offset = day - 1;
                if (gregorian_calendar::is_leap_year(y) && day >= 60) ++offset;
                return date(y, Jan, 1) + days(offset);
            }
            case Kind::ZeroBasedDay:
            default:
                return date(y, Jan, 1) + days(day);
        }
    }

    PosixTzRule parsePosixTzRule(const std::string &text) {
        RuleReader in(text);
        PosixTzRule rule;

        rule.stdAbbrev = in.abbrev();
        rule.stdOffsetSeconds = -in.duration();

        if (in.done()) return rule;

        rule.dstAbbrev = in.abbrev();
        const char c = in.peek();
        if (c == '+' || c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
            rule.dstOffsetSeconds = -in.duration();
        } else {
            rule.dstOffsetSeconds = rule.stdOffsetSeconds + 3600;
        }

        if (in.accept(',')) {
            rule.start = in.transition();
            in.expect(',');
            rule.end = in.transition();
        } else {
            // no rule given: the US rules are the customary default
            const PosixTzRule us = parsePosixTzRule("EST5EDT,M3.2.0,M11.1.0");
            rule.start = us.start;
            rule.end = us.end;
        }

        if (!in.done()) in.fail("trailing characters");
        return rule;
    }

    boost::local_time::time_zone_ptr makeTimeZone(const PosixTzRule &rule) {
        using boost::local_time::custom_time_zone;
        using boost::local_time::dst_adjustment_offsets;
        using boost::local_time::time_zone_names;
        using boost::posix_time::seconds;

        const std::string dstAbbrev = rule.dstAbbrev.value_or("");
        const time_zone_names names(rule.stdAbbrev, rule.stdAbbrev, dstAbbrev, dstAbbrev);

        if (!rule.hasDst()) {
            return boost::make_shared<custom_time_zone>(
                names, seconds(rule.stdOffsetSeconds),
                dst_adjustment_offsets(seconds(0), seconds(0), seconds(0)),
                boost::shared_ptr<boost::local_time::dst_calc_rule>());
        }

        long base = rule.stdOffsetSeconds;
        long save = rule.dstOffsetSeconds - rule.stdOffsetSeconds;
        PosixTransition start = rule.start;
        PosixTransition end = rule.end;
        if (save < 0) {
            // the "DST" period is the shorter one: treat it as standard time
            base = rule.dstOffsetSeconds;
            save = -save;
            std::swap(start, end);
        }

        // start: local standard time, kept within [0, 24h)
        const long startShift = floorDiv(start.seconds, kSecondsPerDay);
        const long startTime = start.seconds - startShift * kSecondsPerDay;

        // end: local DST time, kept within [save, 24h + save) so its standard-time
        // equivalent falls on the same day
        const long endShift = floorDiv(end.seconds - save, kSecondsPerDay);
        const long endTime = end.seconds - endShift * kSecondsPerDay;

        return boost::make_shared<custom_time_zone>(
            names, seconds(base),
            dst_adjustment_offsets(seconds(save), seconds(startTime), seconds(endTime)),
            boost::make_shared<TransitionDayRule>(std::move(start), startShift, std::move(end), endShift));
    }
} // namespace avail
