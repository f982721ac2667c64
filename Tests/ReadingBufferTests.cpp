#include <gtest/gtest.h>
#include "Core/ReadingBuffer.hpp"

static Reading MakeReading(const std::string& ts, double rpm = 0.0) {
    Reading r;
    r.timestamp = ts;
    r.rpm = rpm;
    return r;
}

TEST(ReadingBuffer, KeepsArrivalOrderBelowCapacity) {
    ReadingBuffer buf(3);
    buf.push(MakeReading("R1"));
    buf.push(MakeReading("R2"));

    auto v = buf.toVector();
    ASSERT_EQ(v.size(), 2u);
    EXPECT_EQ(v[0].timestamp, "R1");
    EXPECT_EQ(v[1].timestamp, "R2");
}

TEST(ReadingBuffer, EvictsOldestBeyondCapacity) {
    ReadingBuffer buf(3);
    for (const char* ts : { "R1", "R2", "R3", "R4", "R5" }) buf.push(MakeReading(ts));

    auto v = buf.toVector();
    ASSERT_EQ(v.size(), 3u);
    EXPECT_EQ(v[0].timestamp, "R3");
    EXPECT_EQ(v[1].timestamp, "R4");
    EXPECT_EQ(v[2].timestamp, "R5");
    EXPECT_EQ(buf.capacity(), 3u);
}

TEST(ReadingBuffer, SizeNeverExceedsCapacity) {
    ReadingBuffer buf(10);
    for (int i = 0; i < 1000; ++i) {
        buf.push(MakeReading(std::to_string(i), i));
        ASSERT_LE(buf.size(), 10u);
    }
    EXPECT_EQ(buf.toVector().front().timestamp, "990");
    EXPECT_EQ(buf.toVector().back().timestamp, "999");
}

TEST(ReadingBuffer, ClearEmptiesButKeepsCapacity) {
    ReadingBuffer buf(2);
    buf.push(MakeReading("a"));
    buf.clear();
    EXPECT_TRUE(buf.empty());
    EXPECT_EQ(buf.capacity(), 2u);

    buf.push(MakeReading("b"));
    EXPECT_EQ(buf.size(), 1u);
}

TEST(ReadingBuffer, DefaultCapacity) {
    ReadingBuffer buf;
    EXPECT_EQ(buf.capacity(), ReadingBuffer::kDefaultCapacity);
}

TEST(Reading, FieldLookupByWireName) {
    Reading r;
    r.rpm = 1200.0;
    r.liftForce = 3.5;
    r.extra["drag_force"] = 0.25;

    EXPECT_DOUBLE_EQ(r.field("rpm").value_or(-1), 1200.0);
    EXPECT_DOUBLE_EQ(r.field("lift_force").value_or(-1), 3.5);
    EXPECT_DOUBLE_EQ(r.field("drag_force").value_or(-1), 0.25);
    EXPECT_FALSE(r.field("temperature").has_value());
}
