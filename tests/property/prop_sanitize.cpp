#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "core/sanitize.hpp"

#include <QVariantList>
#include <QVariantMap>
#include <cmath>
#include <functional>
#include <limits>

using namespace tinsel::sanitize;

namespace {

rc::Gen<QString> padded_string() {
    return rc::gen::map(
        rc::gen::container<std::string>(rc::gen::elementOf(std::string(" \tab-Z"))),
        [](const std::string& s) { return QString::fromStdString(s); });
}

rc::Gen<QVariant> scalar() {
    return rc::gen::oneOf(
        rc::gen::just(QVariant{}),
        rc::gen::just(QVariant::fromValue(nullptr)),
        rc::gen::map(rc::gen::arbitrary<bool>(), [](bool b) { return QVariant(b); }),
        rc::gen::map(rc::gen::arbitrary<int>(), [](int i) { return QVariant(i); }),
        rc::gen::map(rc::gen::arbitrary<double>(), [](double d) { return QVariant(d); }),
        rc::gen::elementOf(std::vector<QVariant>{
            QVariant(std::numeric_limits<double>::quiet_NaN()),
            QVariant(std::numeric_limits<double>::infinity()),
            QVariant(-std::numeric_limits<double>::infinity())}),
        rc::gen::map(padded_string(), [](const QString& s) { return QVariant(s); }));
}

rc::Gen<QVariant> value_tree(int depth) {
    if (depth == 0) return scalar();
    auto children = rc::gen::resize(6, rc::gen::container<std::vector<QVariant>>(value_tree(depth - 1)));
    return rc::gen::oneOf(
        scalar(),
        rc::gen::map(children, [](const std::vector<QVariant>& items) {
            return QVariant(QVariantList(items.begin(), items.end()));
        }),
        rc::gen::map(children, [](const std::vector<QVariant>& items) {
            QVariantMap map;
            for (size_t i = 0; i < items.size(); ++i) {
                map.insert(QStringLiteral("k%1").arg(i), items[i]);
            }
            return QVariant(map);
        }));
}

void walk(const QVariant& value, const std::function<void(const QVariant&)>& visit) {
    visit(value);
    if (value.metaType().id() == QMetaType::QVariantMap) {
        for (const auto& child : value.toMap()) walk(child, visit);
    } else if (value.metaType().id() == QMetaType::QVariantList) {
        for (const auto& child : value.toList()) walk(child, visit);
    }
}

bool is_blank_string(const QVariant& value) {
    return value.metaType().id() == QMetaType::QString && value.toString().trimmed().isEmpty();
}

} // namespace

TEST_CASE("Property: output holds no undefined or non-finite values", "[property][sanitize]") {
    rc::check("safe_serialize leaves only serializable members",
        []() {
            const auto input = *value_tree(3);
            const auto out = safe_serialize(input);
            if (!out.value.isValid()) return;

            walk(out.value, [](const QVariant& v) {
                RC_ASSERT(v.isValid());
                if (v.metaType().id() == QMetaType::Double) {
                    RC_ASSERT(std::isfinite(v.toDouble()));
                }
            });
        }
    );
}

TEST_CASE("Property: non-finite numbers become null", "[property][sanitize]") {
    rc::check("NaN and infinities in a list are replaced, not dropped",
        [](const std::vector<bool>& flags) {
            QVariantList list;
            for (bool positive : flags) {
                list.append(positive ? std::numeric_limits<double>::infinity()
                                     : std::numeric_limits<double>::quiet_NaN());
            }
            const auto out = safe_serialize(list).value.toList();
            RC_ASSERT(out.size() == list.size());
            for (const auto& v : out) {
                RC_ASSERT(v.metaType().id() == QMetaType::Nullptr);
            }
        }
    );
}

TEST_CASE("Property: sanitizing twice changes nothing the second time", "[property][sanitize]") {
    rc::check("safe_serialize is idempotent",
        [](bool remove_blank) {
            const auto input = *value_tree(3);
            Options options;
            options.remove_empty_strings = remove_blank;

            const auto once = safe_serialize(input, options);
            if (!once.value.isValid()) return;
            const auto twice = safe_serialize(once.value, options);

            RC_ASSERT(twice.value == once.value);
            RC_ASSERT(twice.report.empty());
        }
    );
}

TEST_CASE("Property: blank strings are dropped only when requested", "[property][sanitize]") {
    rc::check("remove_empty_strings controls blank members",
        []() {
            const auto strings = *rc::gen::container<std::vector<QString>>(padded_string());
            const QVariantList list(strings.begin(), strings.end());

            const auto kept = safe_serialize(list).value.toList();
            RC_ASSERT(kept.size() == list.size());

            Options drop;
            drop.remove_empty_strings = true;
            const auto dropped = safe_serialize(list, drop).value.toList();
            qsizetype blanks = 0;
            for (const auto& s : strings) {
                if (s.trimmed().isEmpty()) ++blanks;
            }
            RC_ASSERT(dropped.size() == list.size() - blanks);
            for (const auto& v : dropped) {
                RC_ASSERT(!is_blank_string(v));
            }
        }
    );
}
