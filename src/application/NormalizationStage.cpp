/**
 * @file NormalizationStage.cpp
 * @brief Implementation of NormalizationStage.
 */

#include "application/NormalizationStage.hpp"
#include "domain/DecisionIdentifier.hpp"
#include "domain/PipelineErrors.hpp"
#include "domain/Utf8.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <initializer_list>
#include <iterator>
#include <limits>
#include <set>

namespace adaharvest::application {

using json = nlohmann::json;
using domain::CalendarDate;
using domain::Field;
using domain::FinancialAmount;
using StringList = std::vector<std::string>;

namespace {

// Epoch values beyond roughly the year 33658 are not dates.
constexpr std::int64_t kMaxEpochMillis = 1000000000000000LL;

// ---- calendar arithmetic (proleptic Gregorian, days since 1970-01-01) ----

std::int64_t DaysFromCivil(std::int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

CalendarDate CivilFromDays(std::int64_t z) {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return CalendarDate{static_cast<int>(y + (m <= 2)), static_cast<int>(m), static_cast<int>(d)};
}

std::int64_t FloorDiv(std::int64_t a, std::int64_t b) {
    std::int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

/** Days since epoch of the last Sunday of @p month. */
std::int64_t LastSunday(int year, unsigned month) {
    static const unsigned kLastDay[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    std::int64_t last = DaysFromCivil(year, month, kLastDay[month - 1]);
    std::int64_t weekday = ((last % 7) + 7 + 4) % 7;   // 1970-01-01 was a Thursday
    return last - weekday;
}

// ---- small string helpers ----

std::string Trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return {};
    size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

bool AllDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

/** First non-null value among @p keys. */
const json* Lookup(const json& fields, std::initializer_list<const char*> keys) {
    if (!fields.is_object()) return nullptr;
    for (const char* key : keys) {
        auto it = fields.find(key);
        if (it != fields.end() && !it->is_null()) return &*it;
    }
    return nullptr;
}

/** Scalar text of a string or integer, std::nullopt for any other JSON type. */
std::optional<std::string> ScalarText(const json& value) {
    if (value.is_string()) return Trim(value.get<std::string>());
    if (value.is_number_integer()) return std::to_string(value.get<long long>());
    if (value.is_number_unsigned()) return std::to_string(value.get<unsigned long long>());
    return std::nullopt;
}

Field<std::string> StringField(const json& fields, std::initializer_list<const char*> keys) {
    const json* value = Lookup(fields, keys);
    if (!value) return Field<std::string>::Missing();
    auto text = ScalarText(*value);
    if (!text) return Field<std::string>::Malformed();
    if (text->empty()) return Field<std::string>::Missing();
    return Field<std::string>::Of(*text);
}

Field<StringList> StringListField(const json& fields, std::initializer_list<const char*> keys) {
    const json* value = Lookup(fields, keys);
    if (!value) return Field<StringList>::Missing();

    StringList items;
    auto add = [&items](const std::string& item) {
        if (!item.empty() && std::find(items.begin(), items.end(), item) == items.end()) {
            items.push_back(item);
        }
    };

    if (value->is_array()) {
        for (const auto& element : *value) {
            auto text = ScalarText(element);
            if (!text) return Field<StringList>::Malformed();
            add(*text);
        }
        return Field<StringList>::Of(items);
    }
    if (auto text = ScalarText(*value)) {
        if (text->empty()) return Field<StringList>::Missing();
        add(*text);
        return Field<StringList>::Of(items);
    }
    return Field<StringList>::Malformed();
}

std::optional<CalendarDate> MakeDate(int year, int month, int day) {
    if (!CalendarDate::IsValid(year, month, day)) return std::nullopt;
    return CalendarDate{year, month, day};
}

/** Leading run of digits of @p s at @p pos, at most @p maxLen long. */
bool ReadNumber(const std::string& s, size_t& pos, size_t minLen, size_t maxLen, int& out) {
    size_t start = pos;
    while (pos < s.size() && pos - start < maxLen && std::isdigit(static_cast<unsigned char>(s[pos]))) {
        ++pos;
    }
    if (pos - start < minLen) return false;
    out = std::stoi(s.substr(start, pos - start));
    return true;
}

std::optional<CalendarDate> ParseDateString(const std::string& raw) {
    const std::string s = Trim(raw);
    if (s.empty()) return std::nullopt;

    if (AllDigits(s) && s.size() >= 9 && s.size() <= 15) {
        return NormalizationStage::AthensDateFromEpochMillis(std::stoll(s));
    }

    size_t pos = 0;
    int a = 0, b = 0, c = 0;

    // YYYY-MM-DD, optionally followed by a time part.
    if (s.size() >= 10 && s[4] == '-' && s[7] == '-') {
        if (!ReadNumber(s, pos, 4, 4, a) || s[pos++] != '-' ||
            !ReadNumber(s, pos, 2, 2, b) || s[pos++] != '-' ||
            !ReadNumber(s, pos, 2, 2, c)) {
            return std::nullopt;
        }
        if (pos != s.size() && s[pos] != 'T' && s[pos] != ' ') return std::nullopt;
        return MakeDate(a, b, c);
    }

    // d/M/yyyy with '/', '-' or '.'.
    if (!ReadNumber(s, pos, 1, 2, a) || pos >= s.size()) return std::nullopt;
    char sep = s[pos];
    if (sep != '/' && sep != '-' && sep != '.') return std::nullopt;
    ++pos;
    if (!ReadNumber(s, pos, 1, 2, b) || pos >= s.size() || s[pos] != sep) return std::nullopt;
    ++pos;
    if (!ReadNumber(s, pos, 4, 4, c)) return std::nullopt;
    if (pos != s.size() && s[pos] != ' ') return std::nullopt;
    return MakeDate(c, b, a);
}

std::optional<std::int64_t> ParseDecimalCents(const std::string& raw, std::string& currencyOut) {
    std::string s;
    // Keep sign, digits and separators; note a currency written inline.
    for (size_t i = 0; i < raw.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(raw[i]);
        if (std::isdigit(c) || c == ',' || c == '.' || c == '-' || c == '+') {
            s.push_back(static_cast<char>(c));
        } else if (c == ' ' || c == '\t') {
            continue;
        } else if (raw.compare(i, 3, "\xE2\x82\xAC") == 0) {   // €
            currencyOut = "EUR";
            i += 2;
        } else if (raw.compare(i, 2, "\xC2\xA0") == 0) {       // no-break space
            i += 1;
        } else if (std::isupper(c) && i + 2 < raw.size() &&
                   std::isupper(static_cast<unsigned char>(raw[i + 1])) &&
                   std::isupper(static_cast<unsigned char>(raw[i + 2]))) {
            currencyOut = raw.substr(i, 3);
            i += 2;
        } else {
            return std::nullopt;
        }
    }

    bool negative = false;
    if (!s.empty() && (s[0] == '-' || s[0] == '+')) {
        negative = s[0] == '-';
        s.erase(0, 1);
    }
    if (s.empty() || s.find_first_of("+-") != std::string::npos) return std::nullopt;

    size_t lastComma = s.rfind(',');
    size_t lastDot = s.rfind('.');
    char decimal = 0;
    if (lastComma != std::string::npos && lastDot != std::string::npos) {
        decimal = lastComma > lastDot ? ',' : '.';
    } else if (lastComma != std::string::npos || lastDot != std::string::npos) {
        char sep = lastComma != std::string::npos ? ',' : '.';
        size_t last = lastComma != std::string::npos ? lastComma : lastDot;
        size_t count = static_cast<size_t>(std::count(s.begin(), s.end(), sep));
        size_t after = s.size() - last - 1;
        // A single separator followed by exactly three digits groups thousands.
        if (count == 1 && after != 3) decimal = sep;
    }

    std::string integerPart;
    std::string fraction;
    bool inFraction = false;
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (decimal != 0 && c == decimal && i == (decimal == ',' ? lastComma : lastDot)) {
            inFraction = true;
            continue;
        }
        if (c == ',' || c == '.') {
            if (inFraction) return std::nullopt;
            continue;   // thousands separator
        }
        (inFraction ? fraction : integerPart).push_back(c);
    }
    if (integerPart.empty() && fraction.empty()) return std::nullopt;
    if (integerPart.size() > 15) return std::nullopt;

    std::int64_t units = integerPart.empty() ? 0 : std::stoll(integerPart);
    int cents = 0;
    if (!fraction.empty()) {
        std::string two = (fraction + "00").substr(0, 2);
        cents = std::stoi(two);
        if (fraction.size() > 2 && fraction[2] >= '5') ++cents;
    }
    std::int64_t total = units * 100 + cents;
    return negative ? -total : total;
}

bool IsCurrencyCode(const std::string& s) {
    return s.size() == 3 && std::all_of(s.begin(), s.end(), [](unsigned char c) { return c >= 'A' && c <= 'Z'; });
}

struct AmountScan {
    std::vector<FinancialAmount> amounts;
    int candidates = 0;
};

void CollectAmounts(const json& node, const std::string& key, const std::string& defaultCurrency, AmountScan& scan) {
    if (node.is_object()) {
        auto amount = node.find("amount");
        if (amount != node.end()) {
            ++scan.candidates;
            json currency = node.contains("currency") ? node["currency"] : json(nullptr);
            if (auto parsed = NormalizationStage::ParseAmount(*amount, currency, defaultCurrency)) {
                scan.amounts.push_back(*parsed);
            }
            return;
        }
        for (auto it = node.begin(); it != node.end(); ++it) {
            CollectAmounts(it.value(), it.key(), defaultCurrency, scan);
        }
        return;
    }
    if (node.is_array()) {
        for (const auto& element : node) {
            CollectAmounts(element, key, defaultCurrency, scan);
        }
        return;
    }
    if ((node.is_number() || node.is_string()) && Lower(key).find("amount") != std::string::npos) {
        ++scan.candidates;
        if (auto parsed = NormalizationStage::ParseAmount(node, json(nullptr), defaultCurrency)) {
            scan.amounts.push_back(*parsed);
        }
    }
}

} // namespace

NormalizationStage::NormalizationStage(Options options) : m_options(std::move(options)) {}

CalendarDate NormalizationStage::AthensDateFromEpochMillis(std::int64_t millis) {
    const std::int64_t seconds = FloorDiv(millis, 1000);
    const int year = CivilFromDays(FloorDiv(seconds, 86400)).year;

    // EU rule: summer time from 01:00 UTC on the last Sunday of March
    // to 01:00 UTC on the last Sunday of October.
    const std::int64_t dstStart = LastSunday(year, 3) * 86400 + 3600;
    const std::int64_t dstEnd = LastSunday(year, 10) * 86400 + 3600;
    const std::int64_t offset = (seconds >= dstStart && seconds < dstEnd) ? 3 * 3600 : 2 * 3600;

    return CivilFromDays(FloorDiv(seconds + offset, 86400));
}

std::optional<CalendarDate> NormalizationStage::ParseDate(const json& value) {
    if (value.is_number_unsigned()) {
        auto millis = value.get<std::uint64_t>();
        if (millis > static_cast<std::uint64_t>(kMaxEpochMillis)) return std::nullopt;
        return AthensDateFromEpochMillis(static_cast<std::int64_t>(millis));
    }
    if (value.is_number_integer()) {
        auto millis = value.get<std::int64_t>();
        if (millis > kMaxEpochMillis || millis < -kMaxEpochMillis) return std::nullopt;
        return AthensDateFromEpochMillis(millis);
    }
    if (value.is_number_float()) {
        double v = value.get<double>();
        if (!std::isfinite(v) || std::fabs(v) > static_cast<double>(kMaxEpochMillis)) return std::nullopt;
        return AthensDateFromEpochMillis(static_cast<std::int64_t>(std::floor(v)));
    }
    if (value.is_string()) {
        return ParseDateString(value.get<std::string>());
    }
    return std::nullopt;
}

std::optional<FinancialAmount> NormalizationStage::ParseAmount(const json& amount,
                                                               const json& currency,
                                                               const std::string& defaultCurrency) {
    FinancialAmount result;
    std::string inlineCurrency;

    if (amount.is_number_unsigned()) {
        auto units = amount.get<std::uint64_t>();
        if (units > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max() / 100)) {
            return std::nullopt;
        }
        result.cents = static_cast<std::int64_t>(units) * 100;
    } else if (amount.is_number_integer()) {
        auto units = amount.get<std::int64_t>();
        if (units > std::numeric_limits<std::int64_t>::max() / 100 ||
            units < std::numeric_limits<std::int64_t>::min() / 100) {
            return std::nullopt;
        }
        result.cents = units * 100;
    } else if (amount.is_number_float()) {
        double v = amount.get<double>();
        if (!std::isfinite(v) || std::fabs(v) > 1e15) return std::nullopt;
        result.cents = std::llround(v * 100.0);
    } else if (amount.is_string()) {
        auto cents = ParseDecimalCents(amount.get<std::string>(), inlineCurrency);
        if (!cents) return std::nullopt;
        result.cents = *cents;
    } else {
        return std::nullopt;
    }

    if (currency.is_string()) {
        std::string code = Trim(currency.get<std::string>());
        if (code == "\xE2\x82\xAC") code = "EUR";
        std::transform(code.begin(), code.end(), code.begin(), [](unsigned char c) { return std::toupper(c); });
        if (!IsCurrencyCode(code)) return std::nullopt;
        result.currency = code;
    } else if (!currency.is_null()) {
        return std::nullopt;
    } else if (!inlineCurrency.empty()) {
        result.currency = inlineCurrency;
    } else {
        result.currency = defaultCurrency;
    }
    return result;
}

bool NormalizationStage::IsConformingId(const std::string& value) {
    return AllDigits(value) && value.size() <= 10;
}

bool NormalizationStage::IsDecisionTypeCode(const std::string& value) {
    size_t pos = 0;
    char32_t cp = 0;
    int headLetters = 0;
    int headDigits = 0;

    // Head: up to three capital letters (Latin or Greek) or one or two digits.
    while (pos < value.size()) {
        size_t n = domain::Utf8::Decode(value, pos, cp);
        if (n == 0) return false;
        bool capital = (cp >= 'A' && cp <= 'Z') || (cp >= 0x0391 && cp <= 0x03A9);
        bool digit = cp >= '0' && cp <= '9';
        if (capital && headDigits == 0) {
            ++headLetters;
        } else if (digit && headLetters == 0) {
            ++headDigits;
        } else {
            break;
        }
        pos += n;
    }
    if ((headLetters == 0 && headDigits == 0) || headLetters > 3 || headDigits > 2) return false;

    // Up to four ".<1-2 digits>" groups.
    int groups = 0;
    while (pos < value.size()) {
        if (value[pos] != '.') return false;
        ++pos;
        size_t start = pos;
        while (pos < value.size() && std::isdigit(static_cast<unsigned char>(value[pos]))) ++pos;
        if (pos - start < 1 || pos - start > 2) return false;
        if (++groups > 4) return false;
    }
    return true;
}

std::string NormalizationStage::relativePath(const std::string& path) const {
    if (m_options.datasetRoot.empty()) return path;
    auto relative = std::filesystem::path(path).lexically_relative(m_options.datasetRoot);
    if (relative.empty() || *relative.begin() == "..") return path;
    return relative.generic_string();
}

domain::StructuredRecord NormalizationStage::normalize(const domain::MetadataEnvelope& envelope,
                                                       const std::optional<domain::ExtractedText>& text,
                                                       const std::optional<domain::RawDocument>& raw) const {
    const json& fields = envelope.fields;
    std::set<std::string> flags;
    domain::StructuredRecord record;

    // Primary key: the identifier the envelope was requested for, else the one it names.
    std::string announced;
    if (const json* ada = Lookup(fields, {"ada"})) {
        if (auto t = ScalarText(*ada)) announced = *t;
    }
    std::string primary = !Trim(envelope.ada).empty() ? envelope.ada : announced;
    if (Trim(primary).empty()) {
        throw domain::ValidationError("metadata envelope carries no decision identifier");
    }
    record.ada = domain::DecisionIdentifier(primary).value();
    if (!announced.empty() && announced != record.ada) flags.insert("ada:mismatch");

    record.protocolNumber = StringField(fields, {"protocolNumber"});
    record.subject = StringField(fields, {"subject"});

    if (const json* issue = Lookup(fields, {"issueDate", "issue_date"})) {
        auto date = ParseDate(*issue);
        record.issueDate = date ? Field<CalendarDate>::Of(*date) : Field<CalendarDate>::Malformed();
    } else {
        record.issueDate = Field<CalendarDate>::Missing();
    }

    record.organizationId = StringField(fields, {"organizationId", "organization"});
    if (record.organizationId.isPresent() && !IsConformingId(record.organizationId.value())) {
        flags.insert("organizationId:nonconforming");
    }

    record.unitIds = StringListField(fields, {"unitIds", "units"});
    if (record.unitIds.isPresent()) {
        for (const auto& unit : record.unitIds.value()) {
            if (!IsConformingId(unit)) flags.insert("unitIds:nonconforming");
        }
    }

    record.signatories = StringListField(fields, {"signatories", "signerIds"});

    auto decisionType = StringField(fields, {"decisionType", "decisionTypeId"});
    if (decisionType.isPresent() && !IsDecisionTypeCode(decisionType.value())) {
        decisionType = Field<std::string>::Malformed();
    }
    record.decisionType = decisionType;

    AmountScan scan;
    for (const char* key : {"financialAmounts", "extraFieldValues"}) {
        if (const json* node = Lookup(fields, {key})) {
            CollectAmounts(*node, key, m_options.defaultCurrency, scan);
        }
    }
    if (scan.candidates == 0) {
        record.financialAmounts = Field<std::vector<FinancialAmount>>::Missing();
    } else if (scan.amounts.empty()) {
        record.financialAmounts = Field<std::vector<FinancialAmount>>::Malformed();
    } else {
        record.financialAmounts = Field<std::vector<FinancialAmount>>::Of(scan.amounts);
    }
    if (static_cast<int>(scan.amounts.size()) < scan.candidates) {
        flags.insert("financialAmounts:unparsable");
    }

    auto tags = StringListField(fields, {"classificationTags", "thematicCategoryIds"});
    if (tags.isPresent()) {
        StringList sorted = tags.value();
        std::sort(sorted.begin(), sorted.end());
        sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());
        tags = Field<StringList>::Of(sorted);
    }
    record.classificationTags = tags;

    if (raw) {
        record.rawDocumentRef = domain::RawDocumentRef{relativePath(raw->storagePath), raw->hash, raw->version};
    } else {
        flags.insert("rawDocument:missing");
    }

    if (text) {
        record.extractedTextRef = domain::ExtractedTextRef{
            relativePath(text->storagePath),
            domain::ExtractionMethodToString(text->method),
            text->rawHash,
            domain::TextQualityToString(text->quality)};
        if (text->quality == domain::TextQuality::Empty) flags.insert("extractedText:empty");
        if (text->quality == domain::TextQuality::Low) flags.insert("extractedText:low-quality");
    } else {
        flags.insert(raw ? "extractedText:failed" : "extractedText:missing");
    }

    const bool core[] = {
        record.protocolNumber.isPresent(),
        record.issueDate.isPresent(),
        record.subject.isPresent(),
        record.organizationId.isPresent(),
        record.decisionType.isPresent(),
        record.signatories.isPresent() && !record.signatories.value().empty()
    };
    const std::ptrdiff_t present = std::count(std::begin(core), std::end(core), true);
    if (present == 0) {
        record.completeness = domain::Completeness::Minimal;
    } else if (present == std::end(core) - std::begin(core) && record.extractedTextRef) {
        record.completeness = domain::Completeness::Complete;
    } else {
        record.completeness = domain::Completeness::Partial;
    }

    record.flags.assign(flags.begin(), flags.end());
    return record;
}

} // namespace adaharvest::application
