#include <QtTest/QtTest>

#include "core/prediction/reasoning_generator.h"

class TestReasoningGenerator : public QObject {
    Q_OBJECT

private slots:
    void testNoRiskFactors();
    void testHarmfulAndToxic();
    void testHelpfulNeedsConfidence();
    void testRuleOrder();
    void testFallbackText();
};

void TestReasoningGenerator::testNoRiskFactors()
{
    vd::FeatureVector features;
    features.isBusinessHours = true;
    features.riskLevel = 0.25;

    const QString text = vd::ReasoningGenerator::explain(features, vd::Decision::Allow, 0.923);
    QCOMPARE(text, QStringLiteral("Allow decision with 92.3% confidence. "
                                  "Reasons: No significant risk factors identified"));
}

void TestReasoningGenerator::testHarmfulAndToxic()
{
    vd::FeatureVector features;
    features.intentIsHarmful = true;
    features.intentIsHelpful = true;
    features.intentConfidence = 0.95;
    features.contentToxicityScore = 0.9;
    features.isBusinessHours = true;
    features.riskLevel = 0.5;

    const QStringList reasons = vd::ReasoningGenerator::reasons(features);
    QCOMPARE(reasons, QStringList({QStringLiteral("Content classified as potentially harmful"),
                                   QStringLiteral("High toxicity score detected")}));

    const QString text = vd::ReasoningGenerator::explain(features, vd::Decision::Deny, 0.81);
    QVERIFY(text.startsWith(QStringLiteral("Deny decision with 81.0% confidence.")));
    QCOMPARE(vd::ReasoningGenerator::explain(features, vd::Decision::Deny, 0.81), text);
}

void TestReasoningGenerator::testHelpfulNeedsConfidence()
{
    vd::FeatureVector features;
    features.intentIsHelpful = true;
    features.intentConfidence = 0.8;
    features.isBusinessHours = true;
    features.riskLevel = 0.25;
    QVERIFY(vd::ReasoningGenerator::reasons(features).isEmpty());

    features.intentConfidence = 0.85;
    QCOMPARE(vd::ReasoningGenerator::reasons(features),
             QStringList{QStringLiteral("High-confidence helpful intent detected")});
}

void TestReasoningGenerator::testRuleOrder()
{
    vd::FeatureVector features;
    features.contentToxicityScore = 0.71;
    features.isBusinessHours = false;
    features.riskLevel = vd::riskLevelValue(vd::RiskLevel::High);

    QCOMPARE(vd::ReasoningGenerator::reasons(features),
             QStringList({QStringLiteral("High toxicity score detected"),
                          QStringLiteral("Request made outside business hours"),
                          QStringLiteral("High risk level assessment")}));
}

void TestReasoningGenerator::testFallbackText()
{
    QCOMPARE(vd::ReasoningGenerator::explainFallback(QStringLiteral("inference_timeout")),
             QStringLiteral("Monitor decision with 50.0% confidence. Reasons: "
                            "Using conservative fallback (inference_timeout)"));
}

QTEST_MAIN(TestReasoningGenerator)
#include "test_reasoning_generator.moc"
