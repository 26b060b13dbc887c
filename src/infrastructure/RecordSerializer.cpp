/**
 * @file RecordSerializer.cpp
 * @brief Implementation of RecordSerializer.
 */

#include "infrastructure/RecordSerializer.hpp"

#include <cstdio>
#include <cstdlib>
#include <stdexcept>

namespace adaharvest::infrastructure {

using json = nlohmann::json;
using namespace adaharvest::domain;

namespace {

template <typename T, typename Encode>
json EncodeScalar(const Field<T>& field, Encode encode) {
    return field.isPresent() ? encode(field.value()) : json(nullptr);
}

template <typename T>
json EncodeArray(const Field<std::vector<T>>& field) {
    return field.isPresent() ? json(field.value()) : json::array();
}

FieldState StateOf(const json& status, const char* key) {
    const std::string s = status.value(key, "missing");
    if (s == "present") return FieldState::Present;
    if (s == "malformed") return FieldState::Malformed;
    return FieldState::Missing;
}

template <typename T>
Field<T> Absent(FieldState state) {
    return state == FieldState::Malformed ? Field<T>::Malformed() : Field<T>::Missing();
}

Field<std::string> DecodeString(const json& j, const json& status, const char* key) {
    FieldState state = StateOf(status, key);
    if (state != FieldState::Present) return Absent<std::string>(state);
    return Field<std::string>::Of(j.at(key).get<std::string>());
}

Field<std::vector<std::string>> DecodeStrings(const json& j, const json& status, const char* key) {
    FieldState state = StateOf(status, key);
    if (state != FieldState::Present) return Absent<std::vector<std::string>>(state);
    return Field<std::vector<std::string>>::Of(j.at(key).get<std::vector<std::string>>());
}

} // namespace

json RecordSerializer::ToJson(const StructuredRecord& record) {
    json j;
    j["schemaVersion"] = StructuredRecord::SchemaVersion;
    j["ada"] = record.ada;
    j["protocolNumber"] = EncodeScalar(record.protocolNumber, [](const std::string& v) { return json(v); });
    j["issueDate"] = EncodeScalar(record.issueDate, [](const CalendarDate& d) { return json(d.toIso()); });
    j["subject"] = EncodeScalar(record.subject, [](const std::string& v) { return json(v); });
    j["organizationId"] = EncodeScalar(record.organizationId, [](const std::string& v) { return json(v); });
    j["unitIds"] = EncodeArray(record.unitIds);
    j["signatories"] = EncodeArray(record.signatories);
    j["decisionType"] = EncodeScalar(record.decisionType, [](const std::string& v) { return json(v); });

    j["financialAmounts"] = json::array();
    if (record.financialAmounts.isPresent()) {
        for (const auto& amount : record.financialAmounts.value()) {
            j["financialAmounts"].push_back({{"amount", amount.toDecimalString()}, {"currency", amount.currency}});
        }
    }
    j["classificationTags"] = EncodeArray(record.classificationTags);

    if (record.extractedTextRef) {
        const auto& ref = *record.extractedTextRef;
        j["extractedTextRef"] = {{"path", ref.path}, {"method", ref.method}, {"rawHash", ref.rawHash}, {"quality", ref.quality}};
    } else {
        j["extractedTextRef"] = nullptr;
    }
    if (record.rawDocumentRef) {
        const auto& ref = *record.rawDocumentRef;
        j["rawDocumentRef"] = {{"path", ref.path}, {"hash", ref.hash}, {"version", ref.version}};
    } else {
        j["rawDocumentRef"] = nullptr;
    }

    j["completeness"] = CompletenessToString(record.completeness);
    j["fieldStatus"] = {
        {"protocolNumber", FieldStateToString(record.protocolNumber.state())},
        {"issueDate", FieldStateToString(record.issueDate.state())},
        {"subject", FieldStateToString(record.subject.state())},
        {"organizationId", FieldStateToString(record.organizationId.state())},
        {"unitIds", FieldStateToString(record.unitIds.state())},
        {"signatories", FieldStateToString(record.signatories.state())},
        {"decisionType", FieldStateToString(record.decisionType.state())},
        {"financialAmounts", FieldStateToString(record.financialAmounts.state())},
        {"classificationTags", FieldStateToString(record.classificationTags.state())}
    };
    j["flags"] = record.flags;
    return j;
}

StructuredRecord RecordSerializer::FromJson(const json& j) {
    StructuredRecord record;
    const json& status = j.at("fieldStatus");

    record.ada = j.at("ada").get<std::string>();
    record.protocolNumber = DecodeString(j, status, "protocolNumber");
    record.subject = DecodeString(j, status, "subject");
    record.organizationId = DecodeString(j, status, "organizationId");
    record.decisionType = DecodeString(j, status, "decisionType");
    record.unitIds = DecodeStrings(j, status, "unitIds");
    record.signatories = DecodeStrings(j, status, "signatories");
    record.classificationTags = DecodeStrings(j, status, "classificationTags");

    FieldState dateState = StateOf(status, "issueDate");
    if (dateState == FieldState::Present) {
        CalendarDate date;
        const std::string iso = j.at("issueDate").get<std::string>();
        if (std::sscanf(iso.c_str(), "%4d-%2d-%2d", &date.year, &date.month, &date.day) != 3) {
            throw std::invalid_argument("issueDate is not YYYY-MM-DD: " + iso);
        }
        record.issueDate = Field<CalendarDate>::Of(date);
    } else {
        record.issueDate = Absent<CalendarDate>(dateState);
    }

    FieldState amountState = StateOf(status, "financialAmounts");
    if (amountState == FieldState::Present) {
        std::vector<FinancialAmount> amounts;
        for (const auto& item : j.at("financialAmounts")) {
            FinancialAmount amount;
            const std::string decimal = item.at("amount").get<std::string>();
            bool negative = !decimal.empty() && decimal[0] == '-';
            long long units = 0;
            int fraction = 0;
            if (std::sscanf(decimal.c_str() + (negative ? 1 : 0), "%lld.%2d", &units, &fraction) != 2 ||
                units < 0 || fraction < 0) {
                throw std::invalid_argument("financial amount is not a decimal string: " + decimal);
            }
            amount.cents = (units * 100 + fraction) * (negative ? -1 : 1);
            amount.currency = item.at("currency").get<std::string>();
            amounts.push_back(amount);
        }
        record.financialAmounts = Field<std::vector<FinancialAmount>>::Of(amounts);
    } else {
        record.financialAmounts = Absent<std::vector<FinancialAmount>>(amountState);
    }

    if (j.contains("extractedTextRef") && j["extractedTextRef"].is_object()) {
        const auto& ref = j["extractedTextRef"];
        record.extractedTextRef = ExtractedTextRef{
            ref.at("path").get<std::string>(), ref.at("method").get<std::string>(),
            ref.at("rawHash").get<std::string>(), ref.at("quality").get<std::string>()};
    }
    if (j.contains("rawDocumentRef") && j["rawDocumentRef"].is_object()) {
        const auto& ref = j["rawDocumentRef"];
        record.rawDocumentRef = RawDocumentRef{
            ref.at("path").get<std::string>(), ref.at("hash").get<std::string>(), ref.at("version").get<int>()};
    }

    const std::string completeness = j.at("completeness").get<std::string>();
    if (completeness == "complete") record.completeness = Completeness::Complete;
    else if (completeness == "partial") record.completeness = Completeness::Partial;
    else record.completeness = Completeness::Minimal;

    record.flags = j.value("flags", std::vector<std::string>{});
    return record;
}

} // namespace adaharvest::infrastructure
