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
	@brief Implementation of SignalSourceController
 */

#include "bodehal.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

SignalSourceController::SignalSourceController(FunctionGenerator& generator, int channel)
	: m_generator(generator)
	, m_channel(channel)
	, m_amplitude(NAN)
{
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Control

void SignalSourceController::Check(bool ok, const char* what)
{
	if(!ok)
	{
		throw DeviceCommunicationError(
			string("Generator ") + m_generator.m_nickname + " did not accept " + what);
	}
}

/**
	@brief Sets up a zero offset sine wave on the channel and turns the output on
 */
void SignalSourceController::Initialize(float amplitude)
{
	LogVerbose("Configuring %s channel %d: sine, %s\n",
		m_generator.m_nickname.c_str(),
		m_channel + 1,
		Unit(Unit::UNIT_VOLTS).PrettyPrint(amplitude).c_str());

	Check(m_generator.SetFunctionChannelShape(m_channel, FunctionGenerator::SHAPE_SINE), "waveform shape");
	Check(m_generator.SetFunctionChannelOffset(m_channel, 0), "offset");
	Check(m_generator.SetFunctionChannelAmplitude(m_channel, amplitude), "amplitude");
	m_amplitude = amplitude;
	Check(m_generator.SetFunctionChannelActive(m_channel, true), "output enable");
}

/**
	@brief Moves the stimulus to a new frequency

	The amplitude is only rewritten if it changed since the last call.
 */
void SignalSourceController::SetFrequency(double hz, float amplitude)
{
	if(amplitude != m_amplitude)
	{
		Check(m_generator.SetFunctionChannelAmplitude(m_channel, amplitude), "amplitude");
		m_amplitude = amplitude;
	}

	LogDebug("Generator frequency %s\n", Unit(Unit::UNIT_HZ).PrettyPrint(hz).c_str());
	Check(m_generator.SetFunctionChannelFrequency(m_channel, hz), "frequency");
}

float SignalSourceController::GetMaxFrequency()
{
	return m_generator.GetFunctionChannelMaxFrequency(m_channel);
}
