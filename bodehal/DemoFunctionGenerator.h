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
	@brief Declaration of DemoFunctionGenerator
 */

#ifndef DemoFunctionGenerator_h
#define DemoFunctionGenerator_h

/**
	@brief Simulated two channel function generator

	Holds its settings in memory. DemoOscilloscope reads them back to synthesize what a real DUT would see.
 */
class DemoFunctionGenerator : public virtual FunctionGenerator
{
public:
	DemoFunctionGenerator();
	virtual ~DemoFunctionGenerator();

	DemoFunctionGenerator(const DemoFunctionGenerator& rhs) =delete;
	DemoFunctionGenerator& operator=(const DemoFunctionGenerator& rhs) =delete;

	virtual std::string GetName() const override;
	virtual std::string GetVendor() const override;
	virtual std::string GetSerial() const override;
	virtual std::string GetTransportConnectionString() override;
	virtual std::string GetTransportName() override;

	virtual std::vector<WaveShape> GetAvailableWaveformShapes(int chan) override;

	virtual bool GetFunctionChannelActive(int chan) override;
	virtual bool SetFunctionChannelActive(int chan, bool on) override;

	virtual float GetFunctionChannelAmplitude(int chan) override;
	virtual bool SetFunctionChannelAmplitude(int chan, float amplitude) override;

	virtual float GetFunctionChannelOffset(int chan) override;
	virtual bool SetFunctionChannelOffset(int chan, float offset) override;

	virtual float GetFunctionChannelFrequency(int chan) override;
	virtual bool SetFunctionChannelFrequency(int chan, float hz) override;

	virtual WaveShape GetFunctionChannelShape(int chan) override;
	virtual bool SetFunctionChannelShape(int chan, WaveShape shape) override;

	virtual float GetFunctionChannelMaxFrequency(int chan) override;

	///@brief Number of frequency changes so far, across both channels
	size_t GetFrequencyChangeCount() const
	{ return m_frequencyChanges; }

protected:
	bool m_active[2];
	float m_amplitude[2];
	float m_offset[2];
	float m_frequency[2];
	WaveShape m_shape[2];

	size_t m_frequencyChanges;

public:
	static std::string GetDriverNameInternal();
	virtual std::string GetDriverName() const override
	{ return GetDriverNameInternal(); }
};

#endif
