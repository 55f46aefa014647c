/***********************************************************************************************************************
*                                                                                                                      *
* libbodehal                                                                                                           *
*                                                                                                                      *
* Copyright (c) 2012-2024 Andrew D. Zonenberg and contributors                                                         *
* All rights reserved.                                                                                                 *
*                                                                                                                      *
* Redistribution and use in source and binary forms, with or without modification, are permitted provided that the     *
* following conditions are met:                                                                                        *
*                                                                                                                      *
*    * Redistributions of source code must retain the above copyright notice, this list of conditions, and the         *
*      following disclaimer.                                                                                           *
*                                                                                                                      *
*    * Redistributions in binary form must reproduce the above copyright notice, this list of conditions and the       *
*      following disclaimer in the documentation and/or other materials provided with the distribution.                *
*                                                                                                                      *
*    * Neither the name of the author nor the names of any contributors may be used to endorse or promote products     *
*      derived from this software without specific prior written permission.                                           *
*                                                                                                                      *
* THIS SOFTWARE IS PROVIDED BY THE AUTHORS "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED   *
* TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL *
* THE AUTHORS BE HELD LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES        *
* (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR       *
* BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT *
* (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE       *
* POSSIBILITY OF SUCH DAMAGE.                                                                                          *
*                                                                                                                      *
***********************************************************************************************************************/

/**
	@file
	@author Andrew D. Zonenberg
	@brief Exceptions thrown by the sweep path
 */

#ifndef BodeException_h
#define BodeException_h

#include <stdexcept>

/**
	@brief Base class for all errors raised while measuring a frequency response
 */
class BodeException : public std::runtime_error
{
public:
	explicit BodeException(const std::string& what)
		: std::runtime_error(what)
	{}
};

/**
	@brief An instrument did not accept or acknowledge a command within its timeout.

	Fatal to the sweep: without a working generator no point can be measured.
 */
class DeviceCommunicationError : public BodeException
{
public:
	explicit DeviceCommunicationError(const std::string& what)
		: BodeException(what)
	{}
};

/**
	@brief No trigger or acquisition completed within the bounded wait
 */
class CaptureTimeoutError : public BodeException
{
public:
	explicit CaptureTimeoutError(const std::string& what)
		: BodeException(what)
	{}
};

/**
	@brief A captured waveform saturated the input range of a scope channel
 */
class ClippingDetectedError : public BodeException
{
public:
	ClippingDetectedError(const std::string& what, size_t channel)
		: BodeException(what)
		, m_channel(channel)
	{}

	///@brief Index of the channel that clipped
	size_t GetChannel() const
	{ return m_channel; }

protected:
	size_t m_channel;
};

/**
	@brief The input signal is below the noise floor, so no meaningful ratio can be formed
 */
class InsufficientSignalError : public BodeException
{
public:
	explicit InsufficientSignalError(const std::string& what)
		: BodeException(what)
	{}
};

/**
	@brief Writing an export file failed. No partial file is left behind.
 */
class OutputWriteError : public BodeException
{
public:
	explicit OutputWriteError(const std::string& what)
		: BodeException(what)
	{}
};

#endif
