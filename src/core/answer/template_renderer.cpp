#include "core/answer/template_renderer.h"
#include "core/ranking/phone_scorer.h"
#include "core/ranking/spec_parser.h"

#include <QStringList>

#include <algorithm>
#include <optional>

namespace pa {

namespace {

const std::vector<PhoneAttribute>& specsAttributes()
{
    static const std::vector<PhoneAttribute> kAttributes = {
        PhoneAttribute::Display, PhoneAttribute::Battery, PhoneAttribute::Camera,
        PhoneAttribute::Ram,     PhoneAttribute::Storage, PhoneAttribute::Chipset,
        PhoneAttribute::Os,      PhoneAttribute::Price,   PhoneAttribute::ReleaseDate,
    };
    return kAttributes;
}

// Side-by-side blocks always cover these, whether or not they differ.
const std::vector<PhoneAttribute>& comparisonBlockAttributes()
{
    static const std::vector<PhoneAttribute> kAttributes = {
        PhoneAttribute::Display, PhoneAttribute::Battery,
        PhoneAttribute::Camera,  PhoneAttribute::Price,
    };
    return kAttributes;
}

QString bullet(const QString& label, const QString& value)
{
    return QStringLiteral("- %1: %2").arg(label, displayValue(value));
}

QString cameraVerdict(const PhoneRecord& a, const PhoneRecord& b)
{
    const std::optional<int> mpA = SpecParser::cameraMegapixels(a.camera);
    const std::optional<int> mpB = SpecParser::cameraMegapixels(b.camera);
    if (!mpA || !mpB) {
        return QStringLiteral("Camera resolution is not listed for both phones; "
                              "see the camera details above.");
    }
    if (*mpA > *mpB) {
        return QStringLiteral("%1 has a better camera (%2MP vs %3MP) and is recommended for photography.")
            .arg(a.modelName).arg(*mpA).arg(*mpB);
    }
    if (*mpB > *mpA) {
        return QStringLiteral("%1 has a better camera (%2MP vs %3MP) and is recommended for photography.")
            .arg(b.modelName).arg(*mpB).arg(*mpA);
    }
    return QStringLiteral("Both phones have similar camera capabilities. "
                          "Consider other factors like price and features.");
}

QString batteryVerdict(const PhoneRecord& a, const PhoneRecord& b)
{
    const std::optional<int> mahA = SpecParser::batteryMah(a.battery);
    const std::optional<int> mahB = SpecParser::batteryMah(b.battery);
    if (!mahA || !mahB) {
        return QStringLiteral("Battery capacity is not listed for both phones; "
                              "see the battery details above.");
    }
    if (*mahA > *mahB) {
        return QStringLiteral("%1 has better battery life (%2mAh vs %3mAh).")
            .arg(a.modelName).arg(*mahA).arg(*mahB);
    }
    if (*mahB > *mahA) {
        return QStringLiteral("%1 has better battery life (%2mAh vs %3mAh).")
            .arg(b.modelName).arg(*mahB).arg(*mahA);
    }
    return QStringLiteral("Both phones have similar battery capacity.");
}

QString recommendationTitle(const CriteriaSet& criteria)
{
    if (criteria.focus.has_value()) {
        switch (*criteria.focus) {
        case Focus::Battery:
            return QStringLiteral("Best Samsung phones for battery life:");
        case Focus::Camera:
            return QStringLiteral("Best Samsung phones for photography:");
        case Focus::Display:
        case Focus::Overall:
            break;
        }
    }
    if (criteria.priceMax.has_value()) {
        // Budgets come straight from the question and may not fit an integer type.
        return QStringLiteral("Best Samsung phones under $%1:")
            .arg(QString::number(*criteria.priceMax, 'f', 0));
    }
    return QStringLiteral("Based on your requirements, here are my recommendations:");
}

std::vector<PhoneRecord> firstRecords(const std::vector<PhoneRecord>& records, size_t count)
{
    return std::vector<PhoneRecord>(records.begin(),
                                    records.begin() + static_cast<std::ptrdiff_t>(std::min(count, records.size())));
}

} // namespace

QString TemplateRenderer::noPhonesFoundMessage()
{
    return QStringLiteral("I couldn't find any Samsung phones matching your query. "
                          "Please try rephrasing your question or ask about specific models "
                          "like Galaxy S24 Ultra, S23, A54, etc.");
}

QString TemplateRenderer::askAboutModelsMessage()
{
    return QStringLiteral("Please ask about specific Samsung phone models "
                          "or describe what you're looking for.");
}

QString TemplateRenderer::renderSpecs(const PhoneRecord& record)
{
    QStringList lines;
    lines.append(QStringLiteral("%1 specifications:").arg(record.modelName));
    lines.append(QString());
    for (PhoneAttribute attribute : specsAttributes()) {
        lines.append(bullet(phoneAttributeLabel(attribute), record.value(attribute)));
    }
    return lines.join(QLatin1Char('\n'));
}

QString TemplateRenderer::renderComparison(const ComparisonResult& comparison,
                                           const CriteriaSet& criteria,
                                           const QString& question)
{
    const PhoneRecord& a = comparison.recordA;
    const PhoneRecord& b = comparison.recordB;

    QStringList lines;
    lines.append(QStringLiteral("Comparing %1 vs %2:").arg(a.modelName, b.modelName));
    lines.append(QString());
    for (PhoneAttribute attribute : comparisonBlockAttributes()) {
        lines.append(phoneAttributeLabel(attribute) + QLatin1Char(':'));
        lines.append(QStringLiteral("  ") + bullet(a.modelName, a.value(attribute)));
        lines.append(QStringLiteral("  ") + bullet(b.modelName, b.value(attribute)));
        lines.append(QString());
    }

    if (comparison.differences.empty()) {
        lines.append(QStringLiteral("Both phones list identical specifications."));
        lines.append(QString());
    }

    lines.append(QStringLiteral("Recommendation:"));
    const Focus focus = criteria.effectiveFocus();
    if (focus == Focus::Camera || question.contains(QStringLiteral("photo"), Qt::CaseInsensitive)) {
        lines.append(cameraVerdict(a, b));
    } else if (focus == Focus::Battery) {
        lines.append(batteryVerdict(a, b));
    } else {
        lines.append(QStringLiteral("%1 is the newer model with improved overall performance and features.")
                         .arg(a.modelName));
    }
    return lines.join(QLatin1Char('\n'));
}

QString TemplateRenderer::renderRecommendation(const std::vector<PhoneRecord>& picks,
                                               const CriteriaSet& criteria)
{
    if (picks.empty()) {
        return noPhonesFoundMessage();
    }

    QStringList lines;
    lines.append(recommendationTitle(criteria));
    lines.append(QString());

    const size_t shown = std::min(picks.size(), static_cast<size_t>(PhoneScorer::kMaxRecommendations));
    for (size_t i = 0; i < shown; ++i) {
        const PhoneRecord& pick = picks[i];
        lines.append(QStringLiteral("%1. %2").arg(i + 1).arg(pick.modelName));
        lines.append(QStringLiteral("   ") + bullet(phoneAttributeLabel(PhoneAttribute::Price), pick.price));
        lines.append(QStringLiteral("   ") + bullet(phoneAttributeLabel(PhoneAttribute::Battery), pick.battery));
        lines.append(QStringLiteral("   ") + bullet(phoneAttributeLabel(PhoneAttribute::Camera), pick.camera));
        lines.append(QStringLiteral("   ") + bullet(phoneAttributeLabel(PhoneAttribute::Display), pick.display));
        lines.append(QString());
    }

    lines.append(QStringLiteral("Top recommendation: %1 offers the best value for your needs.")
                     .arg(picks.front().modelName));
    return lines.join(QLatin1Char('\n'));
}

QString TemplateRenderer::render(const RetrievalResult& retrieval)
{
    if (retrieval.records.empty()) {
        return noPhonesFoundMessage();
    }

    const QueryAnalysis& analysis = retrieval.analysis;
    switch (analysis.intent) {
    case Intent::Specs:
        return renderSpecs(retrieval.records.front());

    case Intent::Comparison:
        if (retrieval.comparison.has_value()) {
            return renderComparison(*retrieval.comparison, analysis.criteria, analysis.originalQuery);
        }
        return renderSpecs(retrieval.records.front());

    case Intent::Recommendation: {
        std::vector<PhoneRecord> picks;
        if (retrieval.recommendation.has_value()) {
            for (const ScoredCandidate& candidate : *retrieval.recommendation) {
                picks.push_back(candidate.record);
            }
        } else {
            picks = firstRecords(retrieval.records, PhoneScorer::kMaxRecommendations);
        }
        return renderRecommendation(picks, analysis.criteria);
    }

    case Intent::General:
        if (retrieval.records.size() == 1) {
            return renderSpecs(retrieval.records.front());
        }
        return renderRecommendation(firstRecords(retrieval.records, PhoneScorer::kMaxRecommendations),
                                    analysis.criteria);
    }
    return askAboutModelsMessage();
}

} // namespace pa
