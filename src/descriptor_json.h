// JSON rendering of note and interval descriptors for --json output.

#ifndef TONAL_DESCRIPTOR_JSON_H
#define TONAL_DESCRIPTOR_JSON_H

#include <string>

#include "core/json_writer.h"
#include "interval/interval.h"
#include "midi/midi_convert.h"
#include "note/note.h"

namespace tonal {

/// @brief Write a note descriptor as a JSON object.
///
/// Every field is present; an empty descriptor writes "empty": true and null
/// for the rest. The frequency is recomputed for the given tuning.
/// @code
///   {"empty":false,"name":"C4","pitch_class":"C","letter":"C","step":0,
///    "accidentals":"","alteration":0,"octave":4,"chroma":0,"midi":60,
///    "height":60,"frequency":261.625565300599,"coord":[0,4]}
/// @endcode
void writeNoteInfo(JsonWriter& writer, const NoteInfo& info,
                   double tuning = midi::kDefaultTuning);

/// @brief Write an interval descriptor as a JSON object ("dir" is 1 or -1).
void writeIntervalInfo(JsonWriter& writer, const IntervalInfo& info);

/// @brief Serialize a note descriptor to a JSON string.
std::string noteInfoToJson(const NoteInfo& info, double tuning = midi::kDefaultTuning);

/// @brief Serialize an interval descriptor to a JSON string.
std::string intervalInfoToJson(const IntervalInfo& info);

}  // namespace tonal

#endif  // TONAL_DESCRIPTOR_JSON_H
