#include <doctest/doctest.h>
#include <limits>
#include "../hpp/AnimalFactTable.hpp"
#include "../hpp/DetectionAggregator.hpp"

namespace {

RawDetection raw(const std::string& label, float conf, float x1 = 10, float y1 = 10, float x2 = 50, float y2 = 60) {
    RawDetection r;
    r.label = label;
    r.confidence = conf;
    r.x1 = x1; r.y1 = y1; r.x2 = x2; r.y2 = y2;
    return r;
}

} // namespace

TEST_CASE("empty model output has no best match") {
    AnimalFactTable facts = AnimalFactTable::builtin();
    DetectionAggregator aggregator(facts);
    DetectionSet set = aggregator.build({});
    CHECK(set.empty());
    CHECK(set.bestMatch() == nullptr);
}

TEST_CASE("best match is highest confidence, ties keep first") {
    AnimalFactTable facts = AnimalFactTable::builtin();
    DetectionAggregator aggregator(facts);

    DetectionSet set = aggregator.build({raw("dog", 0.6f), raw("zebra", 0.9f), raw("cat", 0.9f), raw("cow", 0.3f)});
    REQUIRE(set.size() == 4);
    REQUIRE(set.bestMatch() != nullptr);
    CHECK(set.bestMatch()->label == "zebra");
    CHECK(*set.bestIndex == 1);

    // 顺序与模型输出一致
    CHECK(set.detections[0].label == "dog");
    CHECK(set.detections[3].label == "cow");
}

TEST_CASE("invalid detections are dropped") {
    AnimalFactTable facts = AnimalFactTable::builtin();
    DetectionAggregator aggregator(facts);

    const float nan = std::numeric_limits<float>::quiet_NaN();
    DetectionSet set = aggregator.build({
        raw("dog", 1.5f),                    // 置信度越界
        raw("dog", -0.1f),
        raw("", 0.5f),                       // 空标签
        raw("cat", 0.5f, 50, 10, 10, 60),    // x2 < x1
        raw("cat", 0.5f, 10, 60, 50, 10),    // y2 < y1
        raw("cat", 0.5f, nan, 10, 50, 60),
        raw("horse", 0.7f),
    });
    REQUIRE(set.size() == 1);
    CHECK(set.detections[0].label == "horse");
    CHECK(set.bestMatch()->label == "horse");
}

TEST_CASE("boundary values are valid") {
    CHECK(DetectionAggregator::isValid(raw("bird", 0.0f)));
    CHECK(DetectionAggregator::isValid(raw("bird", 1.0f)));
    CHECK(DetectionAggregator::isValid(raw("bird", 0.5f, 20, 20, 20, 20)));

    std::string reason;
    CHECK_FALSE(DetectionAggregator::isValid(raw("bird", 0.5f, 30, 20, 20, 40), &reason));
    CHECK_FALSE(reason.empty());
}

TEST_CASE("known labels are enriched case-insensitively") {
    AnimalFactTable facts = AnimalFactTable::builtin();
    DetectionAggregator aggregator(facts);

    DetectionSet set = aggregator.build({raw("Zebra", 0.8f, 1, 2, 3, 4)});
    REQUIRE(set.size() == 1);
    const Detection& det = set.detections[0];
    CHECK(det.label == "Zebra");
    CHECK(det.details.title == "Zebra");
    CHECK(det.details.habitat == "African Savannas");
    REQUIRE(det.details.collectiveNoun.has_value());
    CHECK(*det.details.collectiveNoun == "A dazzle of zebras");
    CHECK(det.bbox[0] == doctest::Approx(1));
    CHECK(det.bbox[3] == doctest::Approx(4));
}

TEST_CASE("unknown labels get the placeholder record") {
    AnimalFactTable facts = AnimalFactTable::builtin();
    CHECK(facts.size() == 10);
    CHECK_FALSE(facts.contains("teddy bear"));

    AnimalDetails details = facts.lookup("teddy BEAR");
    CHECK(details.title == "Teddy bear");
    CHECK(details.fact == "An interesting creature detected by the drone!");
    CHECK(details.habitat == "Unknown");
    CHECK_FALSE(details.diet.has_value());
    CHECK_FALSE(details.lifespan.has_value());
}
