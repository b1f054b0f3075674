#include "core/features/feature_extractor.h"
#include "core/shared/logging.h"

#include <QRegularExpression>

#include <algorithm>
#include <utility>
#include <vector>

namespace vd {

namespace {

struct WeightedTerm {
    const char* pattern;
    double weight;
};

// Severe terms weigh 0.5, abusive terms 0.25.
const WeightedTerm kToxicTerms[] = {
    {"kill(?:s|ed|ing)?", 0.5},
    {"murder(?:s|ed|ing)?", 0.5},
    {"bomb(?:s|ing)?", 0.5},
    {"explosives?", 0.5},
    {"terroris[tm]s?", 0.5},
    {"massacre", 0.5},
    {"genocide", 0.5},
    {"behead(?:ing)?", 0.5},
    {"rape", 0.5},
    {"shoot(?:ing)? up", 0.5},
    {"hate", 0.25},
    {"stupid", 0.25},
    {"idiots?", 0.25},
    {"moron(?:s|ic)?", 0.25},
    {"worthless", 0.25},
    {"disgusting", 0.25},
    {"losers?", 0.25},
    {"scum", 0.25},
    {"die", 0.25},
    {"pathetic", 0.25},
};

const QRegularExpression& harmfulIntentRegex()
{
    static const QRegularExpression re(
        QStringLiteral("\\b(?:how (?:to|do i|can i) (?:make|build|get) (?:a )?(?:bomb|weapon|poison)"
                       "|hack into|break into|steal|poison|hurt (?:someone|people|him|her|them)"
                       "|bypass (?:security|authentication)|exploit|attack|kill|destroy)\\b"),
        QRegularExpression::CaseInsensitiveOption);
    return re;
}

const QRegularExpression& helpfulIntentRegex()
{
    static const QRegularExpression re(
        QStringLiteral("\\b(?:please|help|how do i|could you|can you|explain|thanks?|thank you"
                       "|what is|learn|understand|recommend|summari[sz]e)\\b"),
        QRegularExpression::CaseInsensitiveOption);
    return re;
}

int countMatches(const QRegularExpression& re, const QString& text)
{
    int hits = 0;
    QRegularExpressionMatchIterator it = re.globalMatch(text);
    while (it.hasNext()) {
        it.next();
        ++hits;
    }
    return hits;
}

} // namespace

FeatureExtractor::FeatureExtractor()
    : FeatureExtractor(Config{})
{
}

FeatureExtractor::FeatureExtractor(const Config& config)
    : m_config(config)
    , m_zone(config.timezone.toUtf8())
{
    if (!m_zone.isValid()) {
        LOG_WARN(vdCore, "FeatureExtractor: unknown timezone '%s', using UTC",
                 qUtf8Printable(config.timezone));
        m_zone = QTimeZone::utc();
    }
}

double FeatureExtractor::toxicityScore(const QString& content)
{
    static const std::vector<std::pair<QRegularExpression, double>> terms = [] {
        std::vector<std::pair<QRegularExpression, double>> compiled;
        for (const WeightedTerm& term : kToxicTerms) {
            compiled.emplace_back(
                QRegularExpression(QStringLiteral("\\b%1\\b").arg(QLatin1String(term.pattern)),
                                   QRegularExpression::CaseInsensitiveOption),
                term.weight);
        }
        return compiled;
    }();

    double score = 0.0;
    for (const auto& term : terms) {
        if (term.first.match(content).hasMatch()) {
            score += term.second;
        }
    }
    return std::min(score, 1.0);
}

FeatureExtractor::IntentEstimate FeatureExtractor::inferIntent(const QString& content)
{
    IntentEstimate estimate;
    const int harmfulHits = countMatches(harmfulIntentRegex(), content);
    if (harmfulHits > 0) {
        estimate.intentClass = IntentClass::Harmful;
        estimate.confidence = std::min(0.6 + 0.1 * harmfulHits, 0.95);
        return estimate;
    }

    const int helpfulHits = countMatches(helpfulIntentRegex(), content);
    if (helpfulHits > 0) {
        estimate.intentClass = IntentClass::Helpful;
        estimate.confidence = std::min(0.55 + 0.1 * helpfulHits, 0.9);
    }
    return estimate;
}

bool FeatureExtractor::containsUrl(const QString& content)
{
    static const QRegularExpression re(QStringLiteral("(?:\\bhttps?://|\\bwww\\.)\\S+"),
                                       QRegularExpression::CaseInsensitiveOption);
    return re.match(content).hasMatch();
}

bool FeatureExtractor::containsEmail(const QString& content)
{
    static const QRegularExpression re(
        QStringLiteral("[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\\.[A-Za-z]{2,}"));
    return re.match(content).hasMatch();
}

bool FeatureExtractor::containsCode(const QString& content)
{
    if (content.contains(QStringLiteral("```"))) {
        return true;
    }
    static const QRegularExpression re(
        QStringLiteral("\\bdef\\s+\\w+\\s*\\(|\\bfunction\\s*\\w*\\s*\\(|#include\\s*[<\"]"
                       "|\\bclass\\s+\\w+\\s*[:{(]|\\w+\\s*=>|\\breturn\\b[^\\n]*;"));
    return re.match(content).hasMatch();
}

FeatureVector FeatureExtractor::extract(const GovernanceRequest& request) const
{
    const RequestContext& ctx = request.context;
    FeatureVector fv;

    const IntentEstimate inferred = inferIntent(request.content);
    fv.intentClass = ctx.intentClass.value_or(inferred.intentClass);
    if (ctx.intentConfidence) {
        fv.intentConfidence = clampUnit(*ctx.intentConfidence);
    } else if (ctx.intentClass && *ctx.intentClass != inferred.intentClass) {
        fv.intentConfidence = 0.5;
    } else {
        fv.intentConfidence = inferred.confidence;
    }
    fv.intentIsHelpful = fv.intentClass == IntentClass::Helpful;
    fv.intentIsHarmful = fv.intentClass == IntentClass::Harmful;

    fv.contentLength = normalizeContentLength(request.content.size());
    fv.contentHasUrls = containsUrl(request.content);
    fv.contentHasEmail = containsEmail(request.content);
    fv.contentHasCode = containsCode(request.content);

    double toxicity = toxicityScore(request.content);
    if (ctx.toxicityScore) {
        toxicity = std::max(toxicity, *ctx.toxicityScore);
    }
    fv.contentToxicityScore = clampUnit(toxicity);

    fv.userHistoryScore = clampUnit(ctx.userHistoryScore);

    const QDateTime stamp = request.timestamp.isValid()
        ? request.timestamp
        : QDateTime::currentDateTimeUtc();
    const QDateTime local = stamp.toTimeZone(m_zone);
    const int hour = local.time().hour();
    const int day = local.date().dayOfWeek() - 1;
    fv.timeOfDay = normalizeHour(hour);
    fv.dayOfWeek = normalizeDayOfWeek(day);
    fv.isBusinessHours = day < 5
        && hour >= m_config.businessHourStart
        && hour <= m_config.businessHourEnd;

    fv.policyMatchCount = normalizeCount(ctx.policyMatches, kPolicyCountCap);
    fv.policyDenyCount = normalizeCount(ctx.policyDenies, kPolicyCountCap);
    fv.policyAllowCount = normalizeCount(ctx.policyAllows, kPolicyCountCap);
    fv.riskLevel = riskLevelValue(ctx.riskLevel);
    fv.complianceFlags = normalizeCount(ctx.complianceFlagCount, kComplianceFlagCap);
    fv.sensitivityScore = clampUnit(ctx.sensitivityScore);

    return fv;
}

} // namespace vd
