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
	@brief Implementation of CaptureController
 */

#include "bodehal.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

CaptureController::CaptureController(Oscilloscope& scope, const SweepConfiguration& config)
	: m_scope(scope)
	, m_inputChannel(config.m_inputChannel)
	, m_outputChannel(config.m_outputChannel)
	, m_manual(config.m_manualSettings)
	, m_cyclesOnScreen(config.m_cyclesOnScreen)
	, m_headroom(config.m_headroom)
	, m_clipThreshold(config.m_clipThreshold)
	, m_minimumRange(config.m_minimumRange)
	, m_triggerTimeoutMs(config.m_triggerTimeoutMs)
{
	m_expectedAmplitude[m_inputChannel] = 0;
	m_expectedAmplitude[m_outputChannel] = 0;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Setup

/**
	@brief Turns on both channels, centers them, and assumes the full stimulus amplitude on each
 */
void CaptureController::Initialize(double amplitude)
{
	if( (m_inputChannel >= m_scope.GetChannelCount()) || (m_outputChannel >= m_scope.GetChannelCount()) )
	{
		throw DeviceCommunicationError(
			string("Scope ") + m_scope.m_nickname + " has only " + to_string(m_scope.GetChannelCount()) + " channels");
	}

	m_expectedAmplitude[m_inputChannel] = amplitude;
	m_expectedAmplitude[m_outputChannel] = amplitude;

	if(m_manual)
	{
		LogVerbose("Using manual scope settings\n");
		return;
	}

	for(auto i : {m_inputChannel, m_outputChannel})
	{
		m_scope.EnableChannel(i);
		m_scope.SetChannelOffset(i, 0);
	}
	CheckOnline();
}

/**
	@brief Picks the smallest supported timebase at or above the requested one

	@param scales	Supported timebases in fs/div, sorted ascending
	@param fsPerDiv	Desired timebase
 */
int64_t CaptureController::SelectTimebase(const vector<int64_t>& scales, double fsPerDiv)
{
	if(scales.empty())
		return llround(fsPerDiv);

	for(auto s : scales)
	{
		if(s >= fsPerDiv)
			return s;
	}
	return scales.back();
}

/**
	@brief Full scale range leaving the configured headroom around a signal of the given amplitude
 */
double CaptureController::SelectRange(double vpp) const
{
	return max(vpp / m_headroom, m_minimumRange);
}

/**
	@brief Sets timebase and vertical ranges so that several periods of hz fit on screen without clipping
 */
void CaptureController::PrepareForFrequency(double hz)
{
	if(m_manual)
		return;

	double seconds = m_cyclesOnScreen / (hz * m_scope.GetHorizontalDivisions());
	auto timebase = SelectTimebase(m_scope.GetTimebaseScales(), seconds * FS_PER_SECOND);
	if(m_scope.GetTimebaseScale() != timebase)
	{
		LogTrace("Timebase %s/div\n", Unit(Unit::UNIT_FS).PrettyPrint(timebase).c_str());
		m_scope.SetTimebaseScale(timebase);
	}

	for(auto i : {m_inputChannel, m_outputChannel})
	{
		float range = SelectRange(m_expectedAmplitude[i]);
		if(m_scope.GetChannelVoltageRange(i) != range)
		{
			LogTrace("%s range %s\n",
				m_scope.GetChannel(i)->GetHwname().c_str(),
				Unit(Unit::UNIT_VOLTS).PrettyPrint(range).c_str());
			m_scope.SetChannelVoltageRange(i, range);
		}
	}

	CheckOnline();
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Acquisition

void CaptureController::CheckOnline()
{
	if(m_scope.IsOffline())
		throw DeviceCommunicationError(string("Scope ") + m_scope.m_nickname + " stopped responding");
}

/**
	@brief Throws ClippingDetectedError if the waveform reached the edge of the channel range
 */
void CaptureController::CheckClipping(const UniformAnalogWaveform& wfm, size_t channel)
{
	auto name = m_scope.GetChannel(channel)->GetHwname();
	if(wfm.m_flags & WaveformBase::WAVEFORM_CLIPPING)
		throw ClippingDetectedError(name + " clipped", channel);

	//The screen is centered on -offset
	float center = -m_scope.GetChannelOffset(channel);
	float limit = m_clipThreshold * m_scope.GetChannelVoltageRange(channel) / 2;
	for(auto v : wfm.m_samples)
	{
		if(fabs(v - center) >= limit)
			throw ClippingDetectedError(name + " is at the edge of its range", channel);
	}
}

/**
	@brief Runs a single acquisition and returns the input and output waveforms

	@throw CaptureTimeoutError if the scope does not trigger, or the download fails
	@throw ClippingDetectedError if either waveform saturated
	@throw DeviceCommunicationError if the scope went offline
 */
CaptureController::CapturePair CaptureController::CaptureChannels()
{
	double window = m_scope.GetTimebaseScale() * m_scope.GetHorizontalDivisions() * SECONDS_PER_FS;
	double deadline = GetTime() + window + m_triggerTimeoutMs * 1e-3;

	m_scope.StartSingleTrigger();
	while(m_scope.PollTrigger() != Oscilloscope::TRIGGER_MODE_TRIGGERED)
	{
		CheckOnline();
		if(GetTime() > deadline)
		{
			m_scope.Stop();
			throw CaptureTimeoutError("No trigger within " + Unit(Unit::UNIT_FS).PrettyPrint(
				(window + m_triggerTimeoutMs * 1e-3) * FS_PER_SECOND));
		}
		this_thread::sleep_for(chrono::milliseconds(10));
	}

	if(!m_scope.AcquireData())
	{
		CheckOnline();
		throw CaptureTimeoutError("Waveform download failed");
	}

	CapturePair ret;
	ret.first = m_scope.PopChannelWaveform(m_inputChannel);
	ret.second = m_scope.PopChannelWaveform(m_outputChannel);
	if(!ret.first || !ret.second)
		throw CaptureTimeoutError("Acquisition is missing a channel");

	CheckClipping(*ret.first, m_inputChannel);
	CheckClipping(*ret.second, m_outputChannel);
	return ret;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Range tracking

/**
	@brief Doubles the expected amplitude of a channel after it clipped
 */
void CaptureController::EscalateRange(size_t channel)
{
	auto& vpp = m_expectedAmplitude[channel];
	vpp = max(vpp * 2, m_minimumRange * m_headroom * 2);
	LogDebug("Expecting %s on %s\n",
		Unit(Unit::UNIT_VOLTS).PrettyPrint(vpp).c_str(),
		m_scope.GetChannel(channel)->GetHwname().c_str());
}

void CaptureController::UpdateExpectedAmplitude(size_t channel, double vpp)
{
	m_expectedAmplitude[channel] = vpp;
}
