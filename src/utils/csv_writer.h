#pragma once

#include "model/types.h"
#include "utils/calendar.h"
#include "utils/dataset_stats.h"
#include <string>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <ostream>
#include <stdexcept>

namespace fin {

class CsvWriter {
public:
    static const char* header(EntityKind kind) {
        switch (kind) {
            case EntityKind::CUSTOMER:
                return "customer_id,customer_name,email,phone,country,registration_date,"
                       "credit_score,risk_category";
            case EntityKind::MERCHANT:
                return "merchant_id,merchant_name,business_type,country,commission_rate,status";
            case EntityKind::PAYMENT:
                return "payment_id,customer_id,merchant_id,amount,currency,payment_method,"
                       "payment_status,transaction_date,processing_time_seconds,failure_reason,"
                       "risk_score,is_suspicious";
            case EntityKind::SETTLEMENT:
                return "settlement_id,merchant_id,business_date,settlement_date,total_amount,"
                       "commission_amount,net_amount,payment_count,status,sla_breach,"
                       "expected_settlement_date";
        }
        return "";
    }

    static void write_row(std::ostream& f, const Customer& c) {
        f << c.id << "," << escape(c.name) << "," << escape(c.email) << ","
          << escape(c.phone) << "," << c.country << ","
          << Calendar::format_timestamp(c.registration_time) << ","
          << c.credit_score << "," << to_string(c.risk_category) << "\n";
    }

    static void write_row(std::ostream& f, const Merchant& m) {
        f << m.id << "," << escape(m.name) << "," << m.business_type << ","
          << m.country << "," << std::fixed << std::setprecision(2) << m.commission_rate << ","
          << to_string(m.status) << "\n";
    }

    static void write_row(std::ostream& f, const Payment& p) {
        f << p.id << "," << p.customer_id << "," << p.merchant_id << ","
          << std::fixed << std::setprecision(2) << p.amount << ","
          << p.currency << "," << p.payment_method << "," << to_string(p.status) << ","
          << Calendar::format_timestamp(p.transaction_time) << ","
          << p.processing_time_seconds << ","
          << (p.failure_reason ? escape(*p.failure_reason) : std::string()) << ","
          << p.risk_score << "," << (p.is_suspicious ? "true" : "false") << "\n";
    }

    static void write_row(std::ostream& f, const Settlement& s) {
        f << s.id << "," << s.merchant_id << ","
          << Calendar::format_date(s.business_date) << ","
          << Calendar::format_date(s.settlement_date) << ","
          << std::fixed << std::setprecision(2) << s.total_amount << ","
          << s.commission_amount << "," << s.net_amount << ","
          << s.payment_count << "," << to_string(s.status) << ","
          << (s.sla_breach ? "true" : "false") << ","
          << Calendar::format_date(s.expected_settlement_date) << "\n";
    }

    // Quote fields holding a delimiter or quote
    static std::string escape(const std::string& field) {
        if (field.find_first_of(",\"\n") == std::string::npos) return field;
        std::string out = "\"";
        for (char ch : field) {
            if (ch == '"') out += '"';
            out += ch;
        }
        out += '"';
        return out;
    }

    static void write_stats(const std::string& filepath, const DatasetStats& s, uint64_t seed) {
        std::ofstream f(filepath);
        if (!f.is_open()) throw std::runtime_error("Cannot open: " + filepath);

        f << "metric,value\n";
        f << "seed," << seed << "\n";
        f << "customers," << s.customers << "\n";
        f << "merchants," << s.merchants << "\n";
        f << "payments," << s.payments << "\n";
        f << "settlements," << s.settlements << "\n";
        f << "successful," << s.successful << "\n";
        f << "failed," << s.failed << "\n";
        f << "pending," << s.pending << "\n";
        f << "refunded," << s.refunded << "\n";
        f << "success_rate," << std::fixed << std::setprecision(4) << s.success_rate << "\n";
        f << "suspicious_rate," << s.suspicious_rate << "\n";
        f << "outlier_rate," << s.outlier_rate << "\n";
        f << "gross_volume," << std::setprecision(2) << s.gross_volume << "\n";
        f << "settled_volume," << s.settled_volume << "\n";
        f << "commission_total," << s.commission_total << "\n";
        f << "net_total," << s.net_total << "\n";
        f << "avg_amount," << s.avg_amount << "\n";
        f << "avg_risk_score," << s.avg_risk_score << "\n";
        f << "avg_processing_seconds," << s.avg_processing_seconds << "\n";
        f << "sla_breaches," << s.sla_breaches << "\n";
        f << "sla_breach_rate," << std::setprecision(4) << s.sla_breach_rate << "\n";
        f << "settlements_completed," << s.settlements_completed << "\n";
        f << "settlements_pending," << s.settlements_pending << "\n";
        f << "settlements_failed," << s.settlements_failed << "\n";
    }

    static void print_report(const DatasetStats& s, const std::string& title) {
        std::cout << "\n" << std::string(60, '=') << "\n";
        std::cout << "DATASET REPORT: " << title << "\n";
        std::cout << std::string(60, '=') << "\n\n";

        std::cout << "--- Population ---\n";
        std::cout << "  Customers:           " << s.customers
                  << " (" << s.high_risk_customers << " high risk)\n";
        std::cout << "  Merchants:           " << s.merchants << "\n";
        std::cout << "\n--- Payments ---\n";
        std::cout << "  Total:               " << s.payments << "\n";
        std::cout << "  Success / Failed:    " << s.successful << " / " << s.failed << "\n";
        std::cout << "  Pending / Refunded:  " << s.pending << " / " << s.refunded << "\n";
        std::cout << "  Success Rate:        " << std::fixed << std::setprecision(1)
                  << s.success_rate * 100 << "%\n";
        std::cout << "  Suspicious:          " << s.suspicious << " ("
                  << s.suspicious_rate * 100 << "%)\n";
        std::cout << "  Outliers (>=5000):   " << s.outliers << " ("
                  << s.outlier_rate * 100 << "%)\n";
        std::cout << "  Gross Volume:        $" << std::setprecision(2) << s.gross_volume << "\n";
        std::cout << "  Avg Amount:          $" << s.avg_amount << "\n";
        std::cout << "  Avg Risk Score:      " << s.avg_risk_score << "\n";
        std::cout << "  Avg Processing:      " << std::setprecision(1)
                  << s.avg_processing_seconds << " s\n";
        std::cout << "\n--- Settlements ---\n";
        std::cout << "  Batches:             " << s.settlements << "\n";
        std::cout << "  Completed/Pend/Fail: " << s.settlements_completed << " / "
                  << s.settlements_pending << " / " << s.settlements_failed << "\n";
        std::cout << "  Settled Volume:      $" << std::setprecision(2) << s.settled_volume << "\n";
        std::cout << "  Commission:          $" << s.commission_total << "\n";
        std::cout << "  Net Payout:          $" << s.net_total << "\n";
        std::cout << "  SLA Breaches:        " << s.sla_breaches << " ("
                  << std::setprecision(1) << s.sla_breach_rate * 100 << "%)\n";
        std::cout << "\n" << std::string(60, '=') << "\n\n";
    }
};

} // namespace fin
