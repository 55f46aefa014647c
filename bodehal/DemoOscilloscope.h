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
	@brief Declaration of DemoOscilloscope
 */

#ifndef DemoOscilloscope_h
#define DemoOscilloscope_h

#include "TestWaveformSource.h"
#include "DemoFunctionGenerator.h"
#include <random>

/**
	@brief Simulated oscilloscope probing a first order RC low-pass filter

	Two channels:
	* CH1: filter input, i.e. the output of a DemoFunctionGenerator channel
	* CH2: filter output, gain 1/sqrt(1 + (f/fc)^2) and phase -atan(f/fc)

	Both channels are digitized by an 8-bit ADC over 1200 points (100 per division).
 */
class DemoOscilloscope : public virtual Oscilloscope
{
public:
	DemoOscilloscope(DemoFunctionGenerator& generator, double cornerFrequency, int generatorChannel = 0);
	virtual ~DemoOscilloscope();

	//not copyable or assignable
	DemoOscilloscope(const DemoOscilloscope& rhs) =delete;
	DemoOscilloscope& operator=(const DemoOscilloscope& rhs) =delete;

	virtual std::string GetName() const override;
	virtual std::string GetVendor() const override;
	virtual std::string GetSerial() const override;
	virtual std::string GetTransportConnectionString() override;
	virtual std::string GetTransportName() override;

	//Channel configuration
	virtual bool IsChannelEnabled(size_t i) override;
	virtual void EnableChannel(size_t i) override;
	virtual void DisableChannel(size_t i) override;
	virtual float GetChannelVoltageRange(size_t i) override;
	virtual void SetChannelVoltageRange(size_t i, float range) override;
	virtual float GetChannelOffset(size_t i) override;
	virtual void SetChannelOffset(size_t i, float offset) override;

	//Timebase
	virtual int64_t GetTimebaseScale() override;
	virtual void SetTimebaseScale(int64_t fsPerDiv) override;

	//Triggering
	virtual Oscilloscope::TriggerMode PollTrigger() override;
	virtual bool AcquireData() override;
	virtual void StartSingleTrigger() override;
	virtual void Stop() override;

	///@brief Gain of the simulated filter at a given frequency, as a linear ratio
	double GetFilterGain(double hz) const
	{ return 1.0 / sqrt(1 + (hz/m_cornerFrequency) * (hz/m_cornerFrequency)); }

	///@brief Phase of the simulated filter at a given frequency, in degrees
	double GetFilterPhase(double hz) const
	{ return -atan(hz / m_cornerFrequency) * 180 / M_PI; }

	///@brief Sets the RMS noise added to each channel, in volts
	void SetNoise(float stdev)
	{ m_noise = stdev; }

	static const size_t CAPTURE_DEPTH = 1200;

protected:
	DemoFunctionGenerator& m_generator;
	int m_generatorChannel;
	double m_cornerFrequency;

	std::map<size_t, bool> m_channelsEnabled;
	std::map<size_t, float> m_channelVoltageRange;
	std::map<size_t, float> m_channelOffset;
	int64_t m_timebase;

	bool m_triggerArmed;
	float m_noise;

	std::minstd_rand m_rng;
	TestWaveformSource m_source;

public:
	static std::string GetDriverNameInternal();
	virtual std::string GetDriverName() const override
	{ return GetDriverNameInternal(); }
};

#endif
