#include <gtest/gtest.h>
#include "core/PrivacyRedactor.h"

class PrivacyRedactorTest : public ::testing::Test {
protected:
    RegexPrivacyRedactor redactor;
};

TEST_F(PrivacyRedactorTest, MasksPhoneAndCardTogether) {
    const QString out = redactor.redact(
        QStringLiteral("Call me at 555-123-4567, card 4111-1111-1111-1111."));

    EXPECT_EQ(out, QStringLiteral("Call me at [PHONE_REDACTED], card [CARD_REDACTED]."));
}

TEST_F(PrivacyRedactorTest, ContinuousCardIsNotMistakenForPhone) {
    const QString out = redactor.redact(QStringLiteral("Paid with 4111111111111111 yesterday"));
    EXPECT_EQ(out, QStringLiteral("Paid with [CARD_REDACTED] yesterday"));
}

TEST_F(PrivacyRedactorTest, MasksGovernmentId) {
    EXPECT_EQ(redactor.redact(QStringLiteral("SSN 123-45-6789 on file")),
              QStringLiteral("SSN [SSN_REDACTED] on file"));
}

TEST_F(PrivacyRedactorTest, MasksEmail) {
    EXPECT_EQ(redactor.redact(QStringLiteral("Contact jane.doe@example.com today")),
              QStringLiteral("Contact [EMAIL_REDACTED] today"));
}

TEST_F(PrivacyRedactorTest, MasksIpv4) {
    EXPECT_EQ(redactor.redact(QStringLiteral("Server at 192.168.1.20 responded")),
              QStringLiteral("Server at [IP_REDACTED] responded"));
}

TEST_F(PrivacyRedactorTest, MasksDatesOfBirthInAllFormats) {
    EXPECT_EQ(redactor.redact(QStringLiteral("Born 03/15/1985")), QStringLiteral("Born [DOB_REDACTED]"));
    EXPECT_EQ(redactor.redact(QStringLiteral("Born 1985-03-15")), QStringLiteral("Born [DOB_REDACTED]"));
    EXPECT_EQ(redactor.redact(QStringLiteral("Born March 15, 1985")), QStringLiteral("Born [DOB_REDACTED]"));
}

TEST_F(PrivacyRedactorTest, MasksInternationalPhone) {
    EXPECT_EQ(redactor.redact(QStringLiteral("Call +44 20 7946 0958 now")),
              QStringLiteral("Call [PHONE_REDACTED] now"));
}

TEST_F(PrivacyRedactorTest, SpaceGroupedCardAndPhoneLeaveNoDigits) {
    const QString out = redactor.redact(QStringLiteral("Call 555-123-4567 or card 4111 1111 1111 1111"));

    EXPECT_EQ(out, QStringLiteral("Call [PHONE_REDACTED] or card [CARD_REDACTED]"));
    for (const QChar c : out) {
        EXPECT_FALSE(c.isDigit()) << out.toStdString();
    }
}

TEST_F(PrivacyRedactorTest, MasksAmexCards) {
    EXPECT_EQ(redactor.redact(QStringLiteral("Amex 3782 822463 10005 on file")),
              QStringLiteral("Amex [CARD_REDACTED] on file"));
    EXPECT_EQ(redactor.redact(QStringLiteral("Amex 378282246310005 on file")),
              QStringLiteral("Amex [CARD_REDACTED] on file"));
}

TEST_F(PrivacyRedactorTest, MasksContinuousGovernmentId) {
    const RedactionReport report = redactor.redactWithReport(QStringLiteral("Tax id 123456789 recorded"));

    EXPECT_EQ(report.text, QStringLiteral("Tax id [SSN_REDACTED] recorded"));
    EXPECT_EQ(report.categories, QStringList{QStringLiteral("ssn")});
}

TEST_F(PrivacyRedactorTest, MasksIpv6) {
    const RedactionReport report =
        redactor.redactWithReport(QStringLiteral("Host 2001:0db8:85a3:0000:0000:8a2e:0370:7334 is up"));

    EXPECT_EQ(report.text, QStringLiteral("Host [IP_REDACTED] is up"));
    EXPECT_EQ(report.categories, QStringList{QStringLiteral("ip")});
}

TEST_F(PrivacyRedactorTest, RedactionIsIdempotent) {
    const QString input = QStringLiteral(
        "Jane (jane@corp.io, 555-123-4567) paid with 4111 1111 1111 1111 from 10.0.0.7 on 1990-01-02.");

    const QString once = redactor.redact(input);
    EXPECT_NE(once, input);
    EXPECT_EQ(redactor.redact(once), once);
    EXPECT_FALSE(redactor.containsSensitiveData(once));
}

TEST_F(PrivacyRedactorTest, CleanTextIsUntouched) {
    const QString clean = QStringLiteral("The loading dock opens at six.");

    const RedactionReport report = redactor.redactWithReport(clean);
    EXPECT_EQ(report.text, clean);
    EXPECT_FALSE(report.changed);
    EXPECT_TRUE(report.categories.isEmpty());
    EXPECT_FALSE(redactor.containsSensitiveData(clean));
}

TEST_F(PrivacyRedactorTest, ReportListsCategoriesInPrecedenceOrder) {
    const RedactionReport report =
        redactor.redactWithReport(QStringLiteral("Email bob@corp.io or card 4111 1111 1111 1111"));

    EXPECT_TRUE(report.changed);
    EXPECT_EQ(report.categories, QStringList({QStringLiteral("card"), QStringLiteral("email")}));
    EXPECT_EQ(report.text, QStringLiteral("Email [EMAIL_REDACTED] or card [CARD_REDACTED]"));
}

TEST_F(PrivacyRedactorTest, AdvertisesSixPatternFamilies) {
    const QStringList names = redactor.patternsHandled();
    ASSERT_EQ(names.size(), 6);
    EXPECT_EQ(names.first(), QStringLiteral("Credit Card Numbers"));
    EXPECT_TRUE(redactor.containsSensitiveData(QStringLiteral("ping 8.8.8.8")));
}

TEST(NoOpRedactorTest, PassesTextThrough) {
    NoOpRedactor redactor;
    const QString text = QStringLiteral("SSN 123-45-6789");
    EXPECT_EQ(redactor.redact(text), text);
    EXPECT_FALSE(redactor.redactWithReport(text).changed);
    EXPECT_TRUE(redactor.patternsHandled().isEmpty());
}
