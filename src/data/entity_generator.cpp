#include "data/entity_generator.h"
#include "model/errors.h"
#include "utils/calendar.h"
#include <cctype>
#include <cstdio>

namespace fin {

namespace {

const std::vector<std::string> kFirstNames = {
    "James", "Mary", "Robert", "Patricia", "John", "Jennifer", "Michael", "Linda",
    "David", "Elizabeth", "William", "Barbara", "Richard", "Susan", "Joseph", "Jessica",
    "Priya", "Arjun", "Wei", "Mei", "Lukas", "Sophie", "Hugo", "Chloe", "Liam", "Olivia"
};

const std::vector<std::string> kLastNames = {
    "Smith", "Johnson", "Williams", "Brown", "Jones", "Garcia", "Miller", "Davis",
    "Wilson", "Anderson", "Taylor", "Thomas", "Moore", "Martin", "Lee", "Clark",
    "Sharma", "Patel", "Chen", "Wang", "Muller", "Schmidt", "Dubois", "Martin", "Tan", "Walker"
};

const std::vector<std::string> kCompanyStems = {
    "Northwind", "Blue Harbor", "Summit", "Evergreen", "Silverline", "Redwood",
    "Brightpath", "Ironclad", "Golden Gate", "Crescent", "Pioneer", "Starlight",
    "Lakeside", "Granite", "Horizon", "Maple"
};

const std::vector<std::string> kCompanySuffixes = {
    "Traders", "Outfitters", "Goods", "Digital", "Supply Co", "Holdings",
    "Markets", "Travel", "Labs", "Group", "Partners", "Store"
};

const std::vector<std::string> kEmailDomains = {
    "example.com", "mail.com", "inbox.net", "post.org", "webmail.io"
};

const std::vector<std::string> kCountries = {
    "USA", "UK", "CANADA", "GERMANY", "FRANCE", "INDIA", "SINGAPORE", "AUSTRALIA"
};

const std::vector<std::string> kBusinessTypes = {
    "E-COMMERCE", "RETAIL", "SUBSCRIPTION", "MARKETPLACE", "FINANCIAL_SERVICES", "TRAVEL"
};

} // namespace

EntityGenerator::EntityGenerator(RandomSource& rng, EpochSeconds reference_time,
                                 int registration_window_days)
    : rng_(rng),
      reference_time_(reference_time),
      registration_window_days_(registration_window_days),
      merchant_status_(
          {MerchantStatus::ACTIVE, MerchantStatus::INACTIVE, MerchantStatus::SUSPENDED},
          {0.85, 0.10, 0.05}) {}

RiskCategory EntityGenerator::risk_category_for(int credit_score) {
    if (credit_score >= 720) return RiskCategory::LOW;
    if (credit_score >= 600) return RiskCategory::MEDIUM;
    return RiskCategory::HIGH;
}

const std::vector<std::string>& EntityGenerator::countries() { return kCountries; }
const std::vector<std::string>& EntityGenerator::business_types() { return kBusinessTypes; }

std::vector<Customer> EntityGenerator::generate_customers(int count) {
    if (count < 0) {
        throw ConfigurationError("customers", "customer count must be >= 0, got " +
                                 std::to_string(count));
    }

    std::vector<Customer> customers;
    customers.reserve(count);

    const int64_t window_secs = static_cast<int64_t>(registration_window_days_) * kSecondsPerDay;

    for (int i = 0; i < count; ++i) {
        Customer c;
        c.id = make_id("CUST", i + 1, 5);
        c.credit_score = static_cast<int>(rng_.uniform_int(kMinCreditScore, kMaxCreditScore));
        c.risk_category = risk_category_for(c.credit_score);
        c.name = person_name();
        c.email = email_for(c.name, i + 1);
        c.phone = phone_number();
        c.country = rng_.choice(kCountries);
        c.registration_time = reference_time_ - rng_.uniform_int(0, window_secs);
        customers.push_back(std::move(c));
    }

    return customers;
}

std::vector<Merchant> EntityGenerator::generate_merchants(int count) {
    if (count < 0) {
        throw ConfigurationError("merchants", "merchant count must be >= 0, got " +
                                 std::to_string(count));
    }

    std::vector<Merchant> merchants;
    merchants.reserve(count);

    for (int i = 0; i < count; ++i) {
        Merchant m;
        m.id = make_id("MERCH", i + 1, 4);
        m.name = company_name();
        m.business_type = rng_.choice(kBusinessTypes);
        m.country = rng_.choice(kCountries);
        m.commission_rate = round_cents(rng_.uniform_real(kMinCommissionRate, kMaxCommissionRate));
        m.status = merchant_status_.sample(rng_);
        merchants.push_back(std::move(m));
    }

    return merchants;
}

std::string EntityGenerator::person_name() {
    return rng_.choice(kFirstNames) + " " + rng_.choice(kLastNames);
}

std::string EntityGenerator::company_name() {
    return rng_.choice(kCompanyStems) + " " + rng_.choice(kCompanySuffixes);
}

// first.last<seq>@domain; the sequence number keeps addresses unique
std::string EntityGenerator::email_for(const std::string& name, size_t sequence) {
    std::string local;
    local.reserve(name.size() + 8);
    for (char ch : name) {
        if (ch == ' ') local += '.';
        else local += static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    local += std::to_string(sequence);
    return local + "@" + rng_.choice(kEmailDomains);
}

std::string EntityGenerator::phone_number() {
    char buf[24];
    std::snprintf(buf, sizeof(buf), "+1-%03d-%03d-%04d",
                  static_cast<int>(rng_.uniform_int(201, 989)),
                  static_cast<int>(rng_.uniform_int(200, 999)),
                  static_cast<int>(rng_.uniform_int(0, 9999)));
    return buf;
}

} // namespace fin
