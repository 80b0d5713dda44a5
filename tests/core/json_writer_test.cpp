// Tests for core/json_writer.h -- JsonWriter serialization.

#include "core/json_writer.h"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace tonal {
namespace {

// ---------------------------------------------------------------------------
// Structure
// ---------------------------------------------------------------------------

TEST(JsonWriterTest, EmptyContainers) {
  JsonWriter object_writer;
  object_writer.beginObject();
  object_writer.endObject();
  EXPECT_EQ(object_writer.toString(), "{}");

  JsonWriter array_writer;
  array_writer.beginArray();
  array_writer.endArray();
  EXPECT_EQ(array_writer.toString(), "[]");
}

TEST(JsonWriterTest, CommasBetweenMembers) {
  JsonWriter writer;
  writer.beginObject();
  writer.key("name");
  writer.value("C4");
  writer.key("midi");
  writer.value(60);
  writer.key("valid");
  writer.value(true);
  writer.endObject();
  EXPECT_EQ(writer.toString(), R"({"name":"C4","midi":60,"valid":true})");
}

TEST(JsonWriterTest, NestedContainers) {
  JsonWriter writer;
  writer.beginObject();
  writer.key("coord");
  writer.beginArray();
  writer.value(3);
  writer.value(3);
  writer.endArray();
  writer.key("inner");
  writer.beginObject();
  writer.key("x");
  writer.valueNull();
  writer.endObject();
  writer.endObject();
  EXPECT_EQ(writer.toString(), R"({"coord":[3,3],"inner":{"x":null}})");
}

TEST(JsonWriterTest, ArrayOfObjects) {
  JsonWriter writer;
  writer.beginArray();
  writer.beginObject();
  writer.endObject();
  writer.beginObject();
  writer.endObject();
  writer.endArray();
  EXPECT_EQ(writer.toString(), "[{},{}]");
}

// ---------------------------------------------------------------------------
// Values
// ---------------------------------------------------------------------------

TEST(JsonWriterTest, OptionalValues) {
  JsonWriter writer;
  writer.beginArray();
  writer.value(std::optional<int>(60));
  writer.value(std::optional<int>());
  writer.endArray();
  EXPECT_EQ(writer.toString(), "[60,null]");
}

TEST(JsonWriterTest, StringArray) {
  JsonWriter writer;
  writer.value(std::vector<std::string>{"C1", "C2"});
  EXPECT_EQ(writer.toString(), R"(["C1","C2"])");
}

TEST(JsonWriterTest, DoublesRoundTrip) {
  JsonWriter writer;
  writer.beginArray();
  writer.value(440.0);
  writer.value(261.6255653005986);
  writer.value(0.1);
  writer.endArray();
  EXPECT_EQ(writer.toString(), "[440,261.6255653005986,0.1]");
}

TEST(JsonWriterTest, NonFiniteDoublesAreNull) {
  JsonWriter writer;
  writer.beginArray();
  writer.value(std::numeric_limits<double>::quiet_NaN());
  writer.value(std::numeric_limits<double>::infinity());
  writer.endArray();
  EXPECT_EQ(writer.toString(), "[null,null]");
}

TEST(JsonWriterTest, EscapesSpecialCharacters) {
  EXPECT_EQ(JsonWriter::escape("a\"b\\c"), "a\\\"b\\\\c");
  EXPECT_EQ(JsonWriter::escape("line\nbreak\t"), "line\\nbreak\\t");
  EXPECT_EQ(JsonWriter::escape(std::string(1, '\x01')), "\\u0001");
}

}  // namespace
}  // namespace tonal
