/**
 * ============================================================================
 * SOFTWARE: OSL: Sovereign Accounting Suite - Debt Sync Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: debt_types.cpp
 * ============================================================================
 */

#include "debt_types.hpp"
#include "amortization.hpp"
#include "errors.hpp"

namespace dsync {

namespace {

double require_number(const json& doc, const char* field) {
    if (!doc.contains(field) || !doc[field].is_number()) {
        throw ConfigError(std::string("Debt document field '") + field + "' must be a number.");
    }
    return doc[field].get<double>();
}

Timestamp require_timestamp(const json& doc, const char* field) {
    if (!doc.contains(field) || !doc[field].is_string()) {
        throw ConfigError(std::string("Debt document field '") + field + "' must be an ISO 8601 string.");
    }
    auto parsed = parse_iso8601(doc[field].get<std::string>());
    if (!parsed) {
        throw ConfigError(std::string("Debt document field '") + field + "' is not a valid date: " +
                          doc[field].get<std::string>());
    }
    return *parsed;
}

std::optional<CivilDate> optional_date(const json& doc, const char* field) {
    if (!doc.contains(field) || doc[field].is_null()) return std::nullopt;
    // An empty string means "not set", as the portfolio forms store it.
    if (doc[field].is_string() && doc[field].get<std::string>().empty()) return std::nullopt;
    return to_civil(require_timestamp(doc, field));
}

bool optional_flag(const json& doc, const char* field) {
    if (!doc.contains(field) || doc[field].is_null()) return false;
    if (!doc[field].is_boolean()) {
        throw ConfigError(std::string("Debt document field '") + field + "' must be a boolean.");
    }
    return doc[field].get<bool>();
}

} // namespace

bool is_amortised_kind(DebtKind kind) {
    return kind == DebtKind::Loan || kind == DebtKind::StudentLoan || kind == DebtKind::AutoLoan;
}

std::string kind_to_string(DebtKind kind) {
    switch (kind) {
        case DebtKind::CreditCard: return "CREDIT_CARD";
        case DebtKind::Loan: return "LOAN";
        case DebtKind::StudentLoan: return "STUDENT_LOAN";
        case DebtKind::AutoLoan: return "AUTO_LOAN";
        case DebtKind::BuyNowPayLater: return "BNPL";
    }
    return "CREDIT_CARD";
}

std::optional<DebtKind> kind_from_string(const std::string& text) {
    if (text == "CREDIT_CARD") return DebtKind::CreditCard;
    if (text == "LOAN") return DebtKind::Loan;
    if (text == "STUDENT_LOAN") return DebtKind::StudentLoan;
    if (text == "AUTO_LOAN") return DebtKind::AutoLoan;
    if (text == "BNPL") return DebtKind::BuyNowPayLater;
    return std::nullopt;
}

bool has_loan_term(const DebtConfiguration& config) {
    return config.loan_start_date.has_value() && config.loan_end_date.has_value();
}

bool is_paid_off(const DebtConfiguration& config) {
    return config.paid_off;
}

bool is_archived(const DebtConfiguration& config) {
    return config.archived;
}

double suggested_monthly_repayment(const DebtConfiguration& config) {
    if (!is_amortised_kind(config.kind)) return config.monthly_repayment;

    int term = 0;
    if (config.total_term_months && *config.total_term_months > 0) {
        term = *config.total_term_months;
    } else if (has_loan_term(config)) {
        term = months_between(*config.loan_start_date, *config.loan_end_date);
    }

    if (term <= 0) return config.monthly_repayment;
    return amortized_payment(config.current_balance, config.apr, term);
}

DebtConfiguration debt_from_json(const json& doc) {
    if (!doc.is_object()) {
        throw ConfigError("Debt document must be a JSON object.");
    }

    DebtConfiguration config;
    config.current_balance = require_number(doc, "current_balance");
    config.apr = require_number(doc, "apr");
    config.monthly_repayment = require_number(doc, "monthly_repayment");
    config.entered_at = require_timestamp(doc, "entered_at");

    if (!doc.contains("repayment_day_of_month") || !doc["repayment_day_of_month"].is_number_integer()) {
        throw ConfigError("Debt document field 'repayment_day_of_month' must be an integer.");
    }
    config.repayment_day_of_month = doc["repayment_day_of_month"].get<int>();

    if (config.apr < 0.0) {
        throw ConfigError("Debt APR cannot be negative.");
    }
    if (config.repayment_day_of_month < 1 || config.repayment_day_of_month > 31) {
        throw ConfigError("Repayment day of month must be within 1..31.");
    }

    if (doc.contains("kind") && !doc["kind"].is_null()) {
        if (!doc["kind"].is_string()) {
            throw ConfigError("Debt document field 'kind' must be a string.");
        }
        auto kind = kind_from_string(doc["kind"].get<std::string>());
        if (!kind) {
            throw ConfigError("Unknown debt kind: " + doc["kind"].get<std::string>());
        }
        config.kind = *kind;
    }

    config.loan_start_date = optional_date(doc, "loan_start_date");
    config.loan_end_date = optional_date(doc, "loan_end_date");

    if (doc.contains("total_term_months") && !doc["total_term_months"].is_null()) {
        if (!doc["total_term_months"].is_number_integer()) {
            throw ConfigError("Debt document field 'total_term_months' must be an integer.");
        }
        config.total_term_months = doc["total_term_months"].get<int>();
    }

    config.paid_off = optional_flag(doc, "paid_off");
    config.archived = optional_flag(doc, "archived");
    return config;
}

json debt_to_json(const DebtConfiguration& config) {
    json doc = {
        {"kind", kind_to_string(config.kind)},
        {"current_balance", config.current_balance},
        {"apr", config.apr},
        {"monthly_repayment", config.monthly_repayment},
        {"repayment_day_of_month", config.repayment_day_of_month},
        {"entered_at", format_iso8601(config.entered_at)},
        {"paid_off", config.paid_off},
        {"archived", config.archived},
    };

    if (config.loan_start_date) doc["loan_start_date"] = format_date(*config.loan_start_date);
    if (config.loan_end_date) doc["loan_end_date"] = format_date(*config.loan_end_date);
    if (config.total_term_months) doc["total_term_months"] = *config.total_term_months;
    return doc;
}

} // namespace dsync
