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
	@brief Declaration of WaveformBase and UniformAnalogWaveform
 */

#ifndef Waveform_h
#define Waveform_h

/**
	@brief Base class for all waveforms

	One waveform contains a time-series of samples as well as the timing metadata needed to place them on an
	absolute time axis. Samples live in a derived class member.
 */
class WaveformBase
{
public:

	WaveformBase()
		: m_timescale(0)
		, m_startTimestamp(0)
		, m_startFemtoseconds(0)
		, m_triggerPhase(0)
		, m_flags(0)
	{
	}

	virtual ~WaveformBase()
	{}

	/**
		@brief The time scale, in femtoseconds per timestep
	 */
	int64_t m_timescale;

	///@brief Start time of the acquisition, integer part
	time_t	m_startTimestamp;

	///@brief Start time of the acquisition, fractional part (femtoseconds since the UTC second)
	int64_t m_startFemtoseconds;

	/**
		@brief Offset, in femtoseconds, from the trigger to the first sample

		Negative when the capture window starts before the trigger point.
	 */
	int64_t m_triggerPhase;

	/**
		@brief Flags that apply to this waveform. Bitfield containing zero or more WaveformFlags_t values
	 */
	uint8_t m_flags;

	///@brief Flags which may apply to m_flags
	enum WaveformFlags_t
	{
		///@brief Waveform amplitude exceeded ADC range, values were clipped
		WAVEFORM_CLIPPING = 1
	};

	virtual void clear() =0;
	virtual void Resize(size_t size) =0;
	virtual size_t size() const =0;

	bool empty() const
	{ return size() == 0; }

	///@brief Returns the timestamp of sample i, in femtoseconds relative to the trigger
	int64_t GetSampleTime(size_t i) const
	{ return m_triggerPhase + static_cast<int64_t>(i) * m_timescale; }

	///@brief Returns the total duration covered by the samples, in femtoseconds
	int64_t GetDuration() const
	{ return static_cast<int64_t>(size()) * m_timescale; }

	///@brief Returns the sample rate in Hz, or zero if the waveform has no timebase
	double GetSampleRate() const
	{
		if(m_timescale <= 0)
			return 0;
		return FS_PER_SECOND / m_timescale;
	}
};

/**
	@brief A waveform sampled at uniform intervals with floating point voltage samples
 */
class UniformAnalogWaveform : public WaveformBase
{
public:

	UniformAnalogWaveform()
	{}

	virtual ~UniformAnalogWaveform()
	{}

	virtual void clear() override
	{ m_samples.clear(); }

	virtual void Resize(size_t size) override
	{ m_samples.resize(size); }

	virtual size_t size() const override
	{ return m_samples.size(); }

	float& operator[](size_t i)
	{ return m_samples[i]; }

	float operator[](size_t i) const
	{ return m_samples[i]; }

	///@brief Sample data, in volts
	std::vector<float> m_samples;
};

#endif
