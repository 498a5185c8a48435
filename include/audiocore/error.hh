// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <stdexcept>
#include <string>

namespace audiocore {

/**
 * @brief Base exception class for all audiocore errors
 *
 * Catch this to handle every failure raised by the library in one place.
 */
class audiocore_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Invalid construction or configuration parameters
 *
 * Thrown when:
 * - channel count or sample rate is zero
 * - a bit depth is not a supported width for its sample type
 * - a buffer size of zero frames is requested
 * - a generator is given a non-positive frequency
 *
 * Values are never silently clamped.
 */
class configuration_error : public audiocore_error {
public:
    using audiocore_error::audiocore_error;
};

/**
 * @brief A numeric parameter lies outside the range its context accepts
 *
 * Raised by the PCM codec and by audio_format when a bit depth falls
 * outside [8, 64] (integer) or [32, 64] (floating point), or outside the
 * widths the codec implements.
 */
class out_of_range_error : public configuration_error {
public:
    using configuration_error::configuration_error;
};

/**
 * @brief A bit depth inside the accepted range that is not a real width
 *
 * E.g. 12-bit integer or 48-bit floating point data.
 */
class format_error : public audiocore_error {
public:
    using audiocore_error::audiocore_error;
};

/**
 * @brief Input and output disagree on channel count or sample rate
 *
 * Raised by audio_output::add_input before any data flows.
 */
class format_mismatch_error : public audiocore_error {
public:
    using audiocore_error::audiocore_error;
};

/**
 * @brief An operation was attempted in a state where it is meaningless
 *
 * Thrown when:
 * - buffered_audio_input::write is called before a buffer size is set
 * - an input that was never attached is removed from an output
 * - an input is attached twice to the same output
 */
class usage_error : public audiocore_error {
public:
    using audiocore_error::audiocore_error;
};

/**
 * @brief The producer delivered more samples than the ring could hold
 *
 * Only raised when the input's overflow policy is strict. The samples that
 * fitted are kept; the excess is dropped.
 */
class overflow_error : public audiocore_error {
public:
    using audiocore_error::audiocore_error;
};

/**
 * @brief Audio device or backend failure
 *
 * Thrown when a device cannot be opened, a backend is used before
 * initialisation, or a wire format is not supported by the device.
 */
class device_error : public audiocore_error {
public:
    using audiocore_error::audiocore_error;
};

} // namespace audiocore

/*
 * Copyright (C) 2025
 *
 * This file is part of audiocore.
 *
 * audiocore is free software: you can redistribute it and/or modify it under
 * the terms of the GNU Lesser General Public License as published by the Free
 * Software Foundation, either version 3 of the License, or (at your option) any
 * later version.
 *
 * audiocore is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR
 * A PARTICULAR PURPOSE.  See the GNU Lesser General Public License for more
 * details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with audiocore.  If not, see <http://www.gnu.org/licenses/>.
 */
