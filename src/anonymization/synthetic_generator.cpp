#include <cloak/anonymization/synthetic_generator.h>
#include <cloak/entity/span.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <iterator>

namespace cloak::anonymization {

namespace {

constexpr std::string_view kFirstNames[] = {
    "James",  "Mary",    "Robert", "Patricia", "Michael", "Linda",  "William",
    "Sarah",  "David",   "Karen",  "Thomas",   "Nancy",   "Daniel", "Lisa",
    "Joseph", "Emily",   "Mark",   "Laura",    "Steven",  "Anna",   "Kevin",
    "Rachel", "Brian",   "Helen",  "Gregory",  "Megan",   "Peter",  "Olivia"};

constexpr std::string_view kLastNames[] = {
    "Johnson", "Williams", "Brown",  "Jones",    "Garcia",  "Miller",   "Davis",
    "Rodriguez", "Martinez", "Hernandez", "Lopez", "Wilson", "Anderson", "Taylor",
    "Moore",   "Jackson",  "Martin", "Thompson", "White",   "Harris",   "Clark",
    "Lewis",   "Walker",   "Young",  "Allen",    "Wright",  "Scott",    "Baker"};

constexpr std::string_view kStreets[] = {"Maple", "Oak",     "Cedar",   "Pine",   "Elm",
                                         "Lake",  "Hill",    "Park",    "Sunset", "River",
                                         "Forest", "Meadow", "Willow",  "Highland"};

constexpr std::string_view kStreetSuffixes[] = {"Street", "Avenue", "Road", "Lane",
                                                "Drive",  "Court",  "Way",  "Boulevard"};

constexpr std::string_view kCities[] = {
    "Springfield", "Riverside", "Fairview", "Franklin", "Greenville", "Bristol",
    "Clinton",     "Madison",   "Georgetown", "Salem",  "Ashland",    "Oxford",
    "Dover",       "Milford",   "Newport",  "Burlington"};

constexpr std::string_view kStates[] = {
    "Alabama",  "Arizona",   "California", "Colorado",  "Florida",  "Georgia",
    "Illinois", "Indiana",   "Iowa",       "Kentucky",  "Maryland", "Michigan",
    "Minnesota", "Missouri", "Nevada",     "New York",  "Ohio",     "Oregon",
    "Texas",    "Utah",      "Vermont",    "Virginia",  "Washington", "Wisconsin"};

constexpr std::string_view kStateCodes[] = {"AL", "AZ", "CA", "CO", "FL", "GA", "IL", "IN",
                                            "IA", "KY", "MD", "MI", "MN", "MO", "NV", "NY",
                                            "OH", "OR", "TX", "UT", "VT", "VA", "WA", "WI"};

constexpr std::string_view kCompanySuffixes[] = {"Inc", "LLC", "Group", "Ltd", "and Sons",
                                                 "Partners", "Holdings", "Industries"};

constexpr std::string_view kJobs[] = {
    "Accountant",        "Software Engineer", "Nurse",          "Teacher",
    "Civil Engineer",    "Pharmacist",        "Graphic Designer", "Electrician",
    "Sales Manager",     "Data Analyst",      "Architect",      "Librarian",
    "Dentist",           "Chef",              "Journalist",     "Physiotherapist"};

constexpr std::string_view kEmailDomains[] = {"example.com", "example.org", "example.net",
                                              "mail.example.com"};

} // namespace

const char* syntheticCategoryName(SyntheticCategory category) {
    switch (category) {
        case SyntheticCategory::Name: return "name";
        case SyntheticCategory::FirstName: return "first_name";
        case SyntheticCategory::LastName: return "last_name";
        case SyntheticCategory::Email: return "email";
        case SyntheticCategory::Phone: return "phone";
        case SyntheticCategory::Address: return "address";
        case SyntheticCategory::Company: return "company";
        case SyntheticCategory::City: return "city";
        case SyntheticCategory::State: return "state";
        case SyntheticCategory::Job: return "job";
        case SyntheticCategory::Age: return "age";
    }
    return "unknown";
}

Date today() {
    return Date{std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now())};
}

Date addYears(const Date& date, int years) {
    Date shifted = date + std::chrono::years{years};
    if (!shifted.ok()) {
        shifted = shifted.year() / shifted.month() / std::chrono::last;
    }
    return shifted;
}

BasicSyntheticGenerator::BasicSyntheticGenerator(std::string locale,
                                                 std::optional<std::uint64_t> seed)
    : locale_(std::move(locale)), rng_(seed.value_or(std::random_device{}())) {
    if (locale_ != "en_US") {
        spdlog::warn("No synthetic data tables for locale '{}', using en_US", locale_);
    }
}

std::string_view BasicSyntheticGenerator::pick(const std::string_view* table, std::size_t size) {
    std::uniform_int_distribution<std::size_t> dist(0, size - 1);
    return table[dist(rng_)];
}

int BasicSyntheticGenerator::uniform(int lo, int hi) {
    std::uniform_int_distribution<int> dist(lo, hi);
    return dist(rng_);
}

std::string BasicSyntheticGenerator::firstName() {
    return std::string(pick(kFirstNames, std::size(kFirstNames)));
}

std::string BasicSyntheticGenerator::lastName() {
    return std::string(pick(kLastNames, std::size(kLastNames)));
}

std::string BasicSyntheticGenerator::email() {
    const auto first = toLower(firstName());
    const auto last = toLower(lastName());
    const auto domain = pick(kEmailDomains, std::size(kEmailDomains));
    switch (uniform(0, 2)) {
        case 0: return fmt::format("{}.{}@{}", first, last, domain);
        case 1: return fmt::format("{}{}@{}", first.substr(0, 1), last, domain);
        default: return fmt::format("{}{}@{}", first, uniform(1, 99), domain);
    }
}

std::string BasicSyntheticGenerator::phone() {
    return fmt::format("({}) {}-{:04d}", uniform(201, 989), uniform(200, 999), uniform(0, 9999));
}

std::string BasicSyntheticGenerator::address() {
    const auto stateIdx =
        static_cast<std::size_t>(uniform(0, static_cast<int>(std::size(kStateCodes)) - 1));
    return fmt::format("{} {} {}, {}, {} {:05d}", uniform(10, 9999),
                       pick(kStreets, std::size(kStreets)),
                       pick(kStreetSuffixes, std::size(kStreetSuffixes)),
                       pick(kCities, std::size(kCities)), kStateCodes[stateIdx],
                       uniform(1001, 99950));
}

std::string BasicSyntheticGenerator::company() {
    if (uniform(0, 3) == 0) {
        return fmt::format("{}, {} and {}", lastName(), lastName(), lastName());
    }
    return fmt::format("{} {}", lastName(), pick(kCompanySuffixes, std::size(kCompanySuffixes)));
}

std::optional<std::string> BasicSyntheticGenerator::generate(SyntheticCategory category) {
    switch (category) {
        case SyntheticCategory::Name: return firstName() + " " + lastName();
        case SyntheticCategory::FirstName: return firstName();
        case SyntheticCategory::LastName: return lastName();
        case SyntheticCategory::Email: return email();
        case SyntheticCategory::Phone: return phone();
        case SyntheticCategory::Address: return address();
        case SyntheticCategory::Company: return company();
        case SyntheticCategory::City: return std::string(pick(kCities, std::size(kCities)));
        case SyntheticCategory::State: return std::string(pick(kStates, std::size(kStates)));
        case SyntheticCategory::Job: return std::string(pick(kJobs, std::size(kJobs)));
        case SyntheticCategory::Age: return std::to_string(uniform(18, 80));
    }
    return std::nullopt;
}

std::optional<Date> BasicSyntheticGenerator::date(const Date& from, const Date& to) {
    if (!from.ok() || !to.ok()) {
        return std::nullopt;
    }
    const auto lo = std::chrono::sys_days{from}.time_since_epoch().count();
    const auto hi = std::chrono::sys_days{to}.time_since_epoch().count();
    if (hi < lo) {
        return std::nullopt;
    }
    std::uniform_int_distribution<long long> dist(lo, hi);
    return Date{std::chrono::sys_days{std::chrono::days{dist(rng_)}}};
}

} // namespace cloak::anonymization
