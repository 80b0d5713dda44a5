// Tests for descriptor_json.h -- JSON rendering of note and interval descriptors.

#include "descriptor_json.h"

#include <gtest/gtest.h>

#include <string>

namespace tonal {
namespace {

TEST(NoteInfoToJsonTest, FullNote) {
  EXPECT_EQ(noteInfoToJson(note::get("A4")),
            R"({"empty":false,"name":"A4","pitch_class":"A","letter":"A","step":5,)"
            R"("accidentals":"","alteration":0,"octave":4,"chroma":9,"midi":69,)"
            R"("height":69,"frequency":440,"coord":[3,3]})");
}

TEST(NoteInfoToJsonTest, PitchClassHasNullOctaveFields) {
  std::string json = noteInfoToJson(note::get("F#"));
  EXPECT_NE(json.find(R"("octave":null)"), std::string::npos) << json;
  EXPECT_NE(json.find(R"("midi":null)"), std::string::npos) << json;
  EXPECT_NE(json.find(R"("frequency":null)"), std::string::npos) << json;
  EXPECT_NE(json.find(R"("coord":[6])"), std::string::npos) << json;
}

TEST(NoteInfoToJsonTest, TuningChangesFrequency) {
  std::string json = noteInfoToJson(note::get("A5"), 432.0);
  EXPECT_NE(json.find(R"("frequency":864)"), std::string::npos) << json;
}

TEST(NoteInfoToJsonTest, EmptyDescriptor) {
  std::string json = noteInfoToJson(note::get("nope"));
  EXPECT_EQ(json.find(R"({"empty":true,"name":null,)"), 0u) << json;
  EXPECT_NE(json.find(R"("coord":null})"), std::string::npos) << json;
}

TEST(IntervalInfoToJsonTest, DescendingInterval) {
  EXPECT_EQ(intervalInfoToJson(interval::get("-5P")),
            R"({"empty":false,"name":"-5P","num":-5,"quality":"P","type":"perfectable",)"
            R"("step":4,"alt":0,"dir":-1,"simple":-5,"semitones":-7,"chroma":5,"oct":0,)"
            R"("coord":[-1,0,-1]})");
}

TEST(IntervalInfoToJsonTest, EmptyDescriptor) {
  std::string json = intervalInfoToJson(interval::get("3P"));
  EXPECT_EQ(json.find(R"({"empty":true,"name":null,)"), 0u) << json;
}

}  // namespace
}  // namespace tonal
