// Tests for midi/midi_convert.h -- MIDI validation, frequency and naming.

#include "midi/midi_convert.h"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>

namespace tonal {
namespace midi {
namespace {

// ---------------------------------------------------------------------------
// isMidi / toMidi
// ---------------------------------------------------------------------------

TEST(IsMidiTest, Range) {
  EXPECT_TRUE(isMidi(0));
  EXPECT_TRUE(isMidi(127));
  EXPECT_FALSE(isMidi(-1));
  EXPECT_FALSE(isMidi(128));
}

TEST(ToMidiTest, Integers) {
  EXPECT_EQ(toMidi(60), 60);
  EXPECT_FALSE(toMidi(-1).has_value());
  EXPECT_FALSE(toMidi(128).has_value());
}

TEST(ToMidiTest, RealValuesRoundHalfAwayFromZero) {
  EXPECT_EQ(toMidi(60.4), 60);
  EXPECT_EQ(toMidi(60.5), 61);
  EXPECT_EQ(toMidi(-0.4), 0);
  EXPECT_EQ(toMidi(127.4), 127);
  EXPECT_FALSE(toMidi(127.5).has_value());
  EXPECT_FALSE(toMidi(-0.5).has_value());
}

TEST(ToMidiTest, NonFiniteValues) {
  EXPECT_FALSE(toMidi(std::numeric_limits<double>::quiet_NaN()).has_value());
  EXPECT_FALSE(toMidi(std::numeric_limits<double>::infinity()).has_value());
  EXPECT_FALSE(toMidi(-std::numeric_limits<double>::infinity()).has_value());
}

TEST(ToMidiTest, Text) {
  EXPECT_EQ(toMidi(std::string_view("60")), 60);
  EXPECT_EQ(toMidi(std::string_view(" 61 ")), 61);
  EXPECT_EQ(toMidi(std::string_view("C4")), 60);
  EXPECT_EQ(toMidi(std::string_view("A4")), 69);
  EXPECT_EQ(toMidi(std::string_view("C-1")), 0);
  EXPECT_EQ(toMidi(std::string_view("G9")), 127);
  EXPECT_EQ(toMidi(std::string_view("Cb4")), 59);
}

TEST(ToMidiTest, InvalidText) {
  EXPECT_FALSE(toMidi(std::string_view("")).has_value());
  EXPECT_FALSE(toMidi(std::string_view("C")).has_value());
  EXPECT_FALSE(toMidi(std::string_view("G#9")).has_value());
  EXPECT_FALSE(toMidi(std::string_view("Cb-1")).has_value());
  EXPECT_FALSE(toMidi(std::string_view("128")).has_value());
  EXPECT_FALSE(toMidi(std::string_view("blah")).has_value());
  EXPECT_FALSE(toMidi(std::string_view("C40")).has_value());
}

// ---------------------------------------------------------------------------
// midiToFreq / freqToMidi
// ---------------------------------------------------------------------------

TEST(MidiToFreqTest, DefaultTuning) {
  EXPECT_DOUBLE_EQ(midiToFreq(69), 440.0);
  EXPECT_DOUBLE_EQ(midiToFreq(57), 220.0);
  EXPECT_NEAR(midiToFreq(60), 261.6255653005986, 1e-9);
}

TEST(MidiToFreqTest, CustomTuning) {
  EXPECT_DOUBLE_EQ(midiToFreq(69, 443.0), 443.0);
  EXPECT_DOUBLE_EQ(midiToFreq(81, 432.0), 864.0);
}

TEST(FreqToMidiTest, Unrounded) {
  EXPECT_DOUBLE_EQ(freqToMidi(220.0), 57.0);
  EXPECT_DOUBLE_EQ(freqToMidi(440.0), 69.0);
  EXPECT_NEAR(freqToMidi(261.0), 59.9585, 1e-3);
  EXPECT_DOUBLE_EQ(freqToMidi(443.0, 443.0), 69.0);
}

TEST(FreqToMidiTest, InverseOfMidiToFreq) {
  for (int midi = 0; midi <= 127; ++midi) {
    EXPECT_NEAR(freqToMidi(midiToFreq(midi)), midi, 1e-9);
  }
}

// ---------------------------------------------------------------------------
// midiToNoteName
// ---------------------------------------------------------------------------

TEST(MidiToNoteNameTest, Spellings) {
  std::string flats;
  std::string sharps;
  std::string classes;
  for (int midi = 60; midi <= 72; ++midi) {
    flats += midiToNoteName(midi) + " ";
    sharps += midiToNoteName(midi, true) + " ";
    classes += midiToNoteName(midi, false, true) + " ";
  }
  EXPECT_EQ(flats, "C4 Db4 D4 Eb4 E4 F4 Gb4 G4 Ab4 A4 Bb4 B4 C5 ");
  EXPECT_EQ(sharps, "C4 C#4 D4 D#4 E4 F4 F#4 G4 G#4 A4 A#4 B4 C5 ");
  EXPECT_EQ(classes, "C Db D Eb E F Gb G Ab A Bb B C ");
}

TEST(MidiToNoteNameTest, Extremes) {
  EXPECT_EQ(midiToNoteName(0), "C-1");
  EXPECT_EQ(midiToNoteName(127), "G9");
  EXPECT_EQ(midiToNoteName(-1), "");
  EXPECT_EQ(midiToNoteName(128), "");
}

TEST(MidiToNoteNameTest, RealValues) {
  EXPECT_EQ(midiToNoteName(61.2), "Db4");
  EXPECT_EQ(midiToNoteName(61.2, true), "C#4");
  EXPECT_EQ(midiToNoteName(std::numeric_limits<double>::quiet_NaN()), "");
}

}  // namespace
}  // namespace midi
}  // namespace tonal
