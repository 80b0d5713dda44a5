/// @file
/// @brief Descriptor serialization through JsonWriter.

#include "descriptor_json.h"

#include <optional>

namespace tonal {

namespace {

/// @brief Write the fifths/octaves pair of a coordinate as an array.
void writeCoordinates(JsonWriter& writer, const Coordinates& coord) {
  writer.beginArray();
  writer.value(coordinateFifths(coord));
  std::optional<int> octaves = coordinateOctaves(coord);
  if (octaves.has_value()) writer.value(*octaves);
  if (const auto* ivl = std::get_if<IntervalCoordinates>(&coord)) {
    writer.value(directionSign(ivl->direction));
  }
  writer.endArray();
}

}  // namespace

void writeNoteInfo(JsonWriter& writer, const NoteInfo& info, double tuning) {
  writer.beginObject();
  writer.key("empty");
  writer.value(info.empty);
  if (info.empty) {
    for (const char* field : {"name", "pitch_class", "letter", "step", "accidentals",
                              "alteration", "octave", "chroma", "midi", "height",
                              "frequency", "coord"}) {
      writer.key(field);
      writer.valueNull();
    }
    writer.endObject();
    return;
  }

  writer.key("name");
  writer.value(info.name);
  writer.key("pitch_class");
  writer.value(info.pitch_class);
  writer.key("letter");
  writer.value(info.letter);
  writer.key("step");
  writer.value(info.step);
  writer.key("accidentals");
  writer.value(info.accidentals);
  writer.key("alteration");
  writer.value(info.alteration);
  writer.key("octave");
  writer.value(info.octave);
  writer.key("chroma");
  writer.value(info.chroma);
  writer.key("midi");
  writer.value(info.midi);
  writer.key("height");
  writer.value(info.height);
  writer.key("frequency");
  if (info.octave.has_value()) {
    writer.value(midi::midiToFreq(info.height, tuning));
  } else {
    writer.valueNull();
  }
  writer.key("coord");
  writeCoordinates(writer, info.coord);
  writer.endObject();
}

void writeIntervalInfo(JsonWriter& writer, const IntervalInfo& info) {
  writer.beginObject();
  writer.key("empty");
  writer.value(info.empty);
  if (info.empty) {
    for (const char* field : {"name", "num", "quality", "type", "step", "alt", "dir",
                              "simple", "semitones", "chroma", "oct", "coord"}) {
      writer.key(field);
      writer.valueNull();
    }
    writer.endObject();
    return;
  }

  writer.key("name");
  writer.value(info.name);
  writer.key("num");
  writer.value(info.num);
  writer.key("quality");
  writer.value(info.quality);
  writer.key("type");
  writer.value(intervalTypeToString(info.type));
  writer.key("step");
  writer.value(info.step);
  writer.key("alt");
  writer.value(info.alt);
  writer.key("dir");
  writer.value(directionSign(info.dir));
  writer.key("simple");
  writer.value(info.simple);
  writer.key("semitones");
  writer.value(info.semitones);
  writer.key("chroma");
  writer.value(info.chroma);
  writer.key("oct");
  writer.value(info.oct);
  writer.key("coord");
  writeCoordinates(writer, info.coord);
  writer.endObject();
}

std::string noteInfoToJson(const NoteInfo& info, double tuning) {
  JsonWriter writer;
  writeNoteInfo(writer, info, tuning);
  return writer.toString();
}

std::string intervalInfoToJson(const IntervalInfo& info) {
  JsonWriter writer;
  writeIntervalInfo(writer, info);
  return writer.toString();
}

}  // namespace tonal
