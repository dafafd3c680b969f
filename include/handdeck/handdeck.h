#pragma once

/**
 * @file handdeck.h
 * @brief Umbrella header for the HandDeck library
 */

#define HANDDECK_VERSION_MAJOR 1
#define HANDDECK_VERSION_MINOR 0
#define HANDDECK_VERSION_PATCH 0
#define HANDDECK_VERSION_STRING "1.0.0"

#include "handdeck/core/types.hpp"
#include "handdeck/core/exception.h"
#include "handdeck/core/Logger.hpp"
#include "handdeck/core/Configuration.hpp"

#include "handdeck/gesture/GestureTypes.hpp"
#include "handdeck/gesture/GestureClassifier.hpp"
#include "handdeck/gesture/LandmarkStreamReader.hpp"

#include "handdeck/control/ControlTypes.hpp"
#include "handdeck/control/ValueMapping.hpp"
#include "handdeck/control/DeckStateMachine.hpp"
#include "handdeck/control/DeckController.hpp"

#include "handdeck/midi/MidiTypes.hpp"
#include "handdeck/midi/MidiPort.hpp"
#include "handdeck/midi/RtMidiPort.hpp"
#include "handdeck/midi/LatestValueMailbox.hpp"
#include "handdeck/midi/OutputScheduler.hpp"
#include "handdeck/midi/FeedbackReceiver.hpp"

#include "handdeck/app/Settings.hpp"
#include "handdeck/app/GestureMidiController.hpp"
