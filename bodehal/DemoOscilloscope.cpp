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
	@brief Implementation of DemoOscilloscope
 */

#include "bodehal.h"
#include "DemoOscilloscope.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

DemoOscilloscope::DemoOscilloscope(DemoFunctionGenerator& generator, double cornerFrequency, int generatorChannel)
	: m_generator(generator)
	, m_generatorChannel(generatorChannel)
	, m_cornerFrequency(cornerFrequency)
	, m_timebase(FS_PER_SECOND / 1000)
	, m_triggerArmed(false)
	, m_noise(0.001)
	, m_rng(0x5eed)
	, m_source(m_rng)
{
	static const char* colors[2] = { "#ffff00", "#00ffff" };
	for(size_t i=0; i<2; i++)
	{
		m_channels.push_back(new InstrumentChannel(this, string("CH") + to_string(i+1), colors[i], i));

		//initial configuration is 8V full scale
		m_channelsEnabled[i] = true;
		m_channelVoltageRange[i] = 8;
		m_channelOffset[i] = 0;
	}
}

DemoOscilloscope::~DemoOscilloscope()
{
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Information queries

string DemoOscilloscope::GetDriverNameInternal()
{
	return "demo";
}

string DemoOscilloscope::GetName() const
{
	return "Oscilloscope Simulator";
}

string DemoOscilloscope::GetVendor() const
{
	return "Antikernel Labs";
}

string DemoOscilloscope::GetSerial() const
{
	return "12345";
}

string DemoOscilloscope::GetTransportConnectionString()
{
	return "";
}

string DemoOscilloscope::GetTransportName()
{
	return "null";
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Channel configuration

bool DemoOscilloscope::IsChannelEnabled(size_t i)
{
	return m_channelsEnabled[i];
}

void DemoOscilloscope::EnableChannel(size_t i)
{
	m_channelsEnabled[i] = true;
}

void DemoOscilloscope::DisableChannel(size_t i)
{
	m_channelsEnabled[i] = false;
}

float DemoOscilloscope::GetChannelVoltageRange(size_t i)
{
	return m_channelVoltageRange[i];
}

void DemoOscilloscope::SetChannelVoltageRange(size_t i, float range)
{
	m_channelVoltageRange[i] = range;
}

float DemoOscilloscope::GetChannelOffset(size_t i)
{
	return m_channelOffset[i];
}

void DemoOscilloscope::SetChannelOffset(size_t i, float offset)
{
	m_channelOffset[i] = offset;
}

int64_t DemoOscilloscope::GetTimebaseScale()
{
	return m_timebase;
}

void DemoOscilloscope::SetTimebaseScale(int64_t fsPerDiv)
{
	m_timebase = fsPerDiv;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Triggering

Oscilloscope::TriggerMode DemoOscilloscope::PollTrigger()
{
	//Always trigger on the first poll
	if(m_triggerArmed)
		return TRIGGER_MODE_TRIGGERED;
	return TRIGGER_MODE_STOP;
}

void DemoOscilloscope::StartSingleTrigger()
{
	ClearPendingWaveforms();
	m_triggerArmed = true;
}

void DemoOscilloscope::Stop()
{
	m_triggerArmed = false;
}

bool DemoOscilloscope::AcquireData()
{
	if(!m_triggerArmed)
	{
		LogWarning("DemoOscilloscope: AcquireData() called without a trigger\n");
		return false;
	}
	m_triggerArmed = false;
	ClearPendingWaveforms();

	//Nothing on the wire if the generator output is off
	double hz = m_generator.GetFunctionChannelFrequency(m_generatorChannel);
	float vin = m_generator.GetFunctionChannelAmplitude(m_generatorChannel);
	if(!m_generator.GetFunctionChannelActive(m_generatorChannel))
		vin = 0;

	float period = FS_PER_SECOND / hz;
	int64_t sampleperiod = m_timebase * GetHorizontalDivisions() / CAPTURE_DEPTH;
	if(sampleperiod <= 0)
		sampleperiod = 1;

	//Random trigger point relative to the sine
	uniform_real_distribution<float> phase(0, 2*M_PI);
	float startphase = phase(m_rng);

	float gain = GetFilterGain(hz);
	float shift = GetFilterPhase(hz) * M_PI / 180;

	double now = GetTime();
	for(size_t i=0; i<2; i++)
	{
		if(!m_channelsEnabled[i])
			continue;

		unique_ptr<UniformAnalogWaveform> wfm;
		if(i == 0)
			wfm = m_source.GenerateNoisySinewave(vin, startphase, period, sampleperiod, CAPTURE_DEPTH, m_noise);
		else
			wfm = m_source.GenerateNoisySinewave(vin*gain, startphase + shift, period, sampleperiod, CAPTURE_DEPTH, m_noise);

		TestWaveformSource::Quantize(*wfm, m_channelVoltageRange[i], m_channelOffset[i]);
		wfm->m_triggerPhase = 0;
		wfm->m_startTimestamp = floor(now);
		wfm->m_startFemtoseconds = (now - floor(now)) * FS_PER_SECOND;

		SetChannelWaveform(i, std::move(wfm));
	}

	return true;
}
