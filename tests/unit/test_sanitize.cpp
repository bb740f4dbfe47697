#include <catch2/catch_test_macros.hpp>
#include "core/sanitize.hpp"

#include <QDateTime>
#include <QJsonArray>
#include <QJsonObject>
#include <QUrl>
#include <algorithm>
#include <cmath>
#include <limits>

using namespace tinsel;
using namespace tinsel::sanitize;

namespace {

bool contains(const std::vector<std::string>& paths, const std::string& path) {
    return std::find(paths.begin(), paths.end(), path) != paths.end();
}

const double kNan = std::numeric_limits<double>::quiet_NaN();
const double kInf = std::numeric_limits<double>::infinity();

} // namespace

TEST_CASE("safe_serialize trims strings", "[sanitize]") {
    auto out = safe_serialize(QVariantMap{{QStringLiteral("client"), QStringLiteral("  Hollis  ")}});

    REQUIRE(out.value.toMap().value(QStringLiteral("client")).toString() == QStringLiteral("Hollis"));
    REQUIRE(contains(out.report.trimmed, "client"));
    REQUIRE(out.report.changes.size() == 1);
    REQUIRE(out.report.changes.front().reason == ChangeReason::Trim);
}

TEST_CASE("blank strings are kept unless removal is requested", "[sanitize]") {
    const QVariantMap input{{QStringLiteral("zip"), QStringLiteral("   ")}};

    auto kept = safe_serialize(input);
    REQUIRE(kept.value.toMap().contains(QStringLiteral("zip")));
    REQUIRE(kept.value.toMap().value(QStringLiteral("zip")).toString().isEmpty());

    auto dropped = safe_serialize(input, Options{.remove_empty_strings = true});
    REQUIRE_FALSE(dropped.value.toMap().contains(QStringLiteral("zip")));
    REQUIRE(contains(dropped.report.removed, "zip"));
}

TEST_CASE("non-finite numbers become null", "[sanitize]") {
    auto out = safe_serialize(QVariantMap{
        {QStringLiteral("nan"), kNan},
        {QStringLiteral("inf"), kInf},
        {QStringLiteral("neg"), -kInf},
        {QStringLiteral("ok"), 12.5},
    });
    const auto map = out.value.toMap();

    REQUIRE(map.value(QStringLiteral("nan")).metaType().id() == QMetaType::Nullptr);
    REQUIRE(map.value(QStringLiteral("inf")).metaType().id() == QMetaType::Nullptr);
    REQUIRE(map.value(QStringLiteral("neg")).metaType().id() == QMetaType::Nullptr);
    REQUIRE(map.value(QStringLiteral("ok")).toDouble() == 12.5);
    REQUIRE(out.report.replaced.size() == 3);
}

TEST_CASE("undefined members are removed, arrays are compacted", "[sanitize]") {
    auto out = safe_serialize(QVariantMap{
        {QStringLiteral("gone"), QVariant{}},
        {QStringLiteral("tags"), QVariantList{QStringLiteral("a"), QVariant{}, QStringLiteral("b")}},
        {QStringLiteral("nested"), QVariantMap{{QStringLiteral("inner"), QVariant{}},
                                               {QStringLiteral("kept"), true}}},
    });
    const auto map = out.value.toMap();

    REQUIRE_FALSE(map.contains(QStringLiteral("gone")));
    REQUIRE(map.value(QStringLiteral("tags")).toList().size() == 2);
    REQUIRE(map.value(QStringLiteral("tags")).toList().at(1).toString() == QStringLiteral("b"));
    REQUIRE_FALSE(map.value(QStringLiteral("nested")).toMap().contains(QStringLiteral("inner")));
    REQUIRE(map.value(QStringLiteral("nested")).toMap().value(QStringLiteral("kept")).toBool());

    REQUIRE(contains(out.report.removed, "gone"));
    REQUIRE(contains(out.report.removed, "tags[1]"));
    REQUIRE(contains(out.report.removed, "nested.inner"));
}

TEST_CASE("booleans, integers and null pass through", "[sanitize]") {
    auto out = safe_serialize(QVariantMap{
        {QStringLiteral("vip"), false},
        {QStringLiteral("count"), 3},
        {QStringLiteral("none"), QVariant::fromValue(nullptr)},
    });
    const auto map = out.value.toMap();

    REQUIRE(map.value(QStringLiteral("vip")).toBool() == false);
    REQUIRE(map.value(QStringLiteral("count")).toInt() == 3);
    REQUIRE(map.value(QStringLiteral("none")).metaType().id() == QMetaType::Nullptr);
    REQUIRE(out.report.empty());
}

TEST_CASE("dates pass when valid and become null when not", "[sanitize]") {
    const auto valid = QDateTime::fromMSecsSinceEpoch(1700000000000);
    auto out = safe_serialize(QVariantMap{
        {QStringLiteral("at"), valid},
        {QStringLiteral("bad"), QDateTime()},
    });
    const auto map = out.value.toMap();

    REQUIRE(map.value(QStringLiteral("at")).toDateTime() == valid);
    REQUIRE(map.value(QStringLiteral("bad")).metaType().id() == QMetaType::Nullptr);
    REQUIRE(contains(out.report.replaced, "bad"));
    REQUIRE(out.report.changes.back().reason == ChangeReason::InvalidDate);
}

TEST_CASE("unserializable values are dropped and reported", "[sanitize]") {
    auto out = safe_serialize(QVariantMap{
        {QStringLiteral("handle"), QVariant::fromValue(QUrl(QStringLiteral("https://example.com")))},
        {QStringLiteral("name"), QStringLiteral("x")},
    });

    REQUIRE_FALSE(out.value.toMap().contains(QStringLiteral("handle")));
    REQUIRE(contains(out.report.removed, "handle"));
}

TEST_CASE("JSON values are sanitized like plain maps", "[sanitize]") {
    QJsonObject json{
        {QStringLiteral("crew"), QStringLiteral(" Crew Alpha ")},
        {QStringLiteral("list"), QJsonArray{1, QStringLiteral(" b ")}},
    };
    auto out = safe_serialize(QVariant::fromValue(json));
    const auto map = out.value.toMap();

    REQUIRE(map.value(QStringLiteral("crew")).toString() == QStringLiteral("Crew Alpha"));
    REQUIRE(map.value(QStringLiteral("list")).toList().at(1).toString() == QStringLiteral("b"));
    REQUIRE(contains(out.report.trimmed, "list[1]"));
}

TEST_CASE("removing the root yields an invalid value", "[sanitize]") {
    auto out = safe_serialize(QVariant{});
    REQUIRE_FALSE(out.value.isValid());
    REQUIRE(out.report.removed == std::vector<std::string>{""});
}

TEST_CASE("strip_undefined only prunes undefined members", "[sanitize]") {
    auto out = strip_undefined(QVariantMap{
        {QStringLiteral("gone"), QVariant{}},
        {QStringLiteral("padded"), QStringLiteral("  x  ")},
        {QStringLiteral("nan"), kNan},
        {QStringLiteral("blank"), QString()},
    });
    const auto map = out.value.toMap();

    REQUIRE_FALSE(map.contains(QStringLiteral("gone")));
    REQUIRE(map.value(QStringLiteral("padded")).toString() == QStringLiteral("  x  "));
    REQUIRE(std::isnan(map.value(QStringLiteral("nan")).toDouble()));
    REQUIRE(map.contains(QStringLiteral("blank")));
    REQUIRE(out.report.removed == std::vector<std::string>{"gone"});
    REQUIRE(out.report.trimmed.empty());
}

TEST_CASE("Report::merge prefixes paths", "[sanitize]") {
    Report inner;
    inner.record_removed("notes");
    inner.record_removed("[2]");
    inner.record_change("", QStringLiteral(" a "), QStringLiteral("a"), ChangeReason::Trim);

    Report outer;
    outer.merge(inner, "job");

    REQUIRE(outer.removed == std::vector<std::string>{"job.notes", "job[2]"});
    REQUIRE(outer.trimmed == std::vector<std::string>{"job"});
    REQUIRE(outer.changes.front().path == "job");
    REQUIRE(outer.describe().contains(QStringLiteral("job.notes")));
}
