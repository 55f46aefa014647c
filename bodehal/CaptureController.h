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
	@brief Declaration of CaptureController
 */

#ifndef CaptureController_h
#define CaptureController_h

/**
	@brief Configures an oscilloscope for one stimulus frequency and captures the DUT input and output

	Keeps an estimate of the peak-to-peak amplitude expected on each of the two channels. The vertical range of
	each channel follows that estimate, and clipping pushes it up.
 */
class CaptureController
{
public:
	CaptureController(Oscilloscope& scope, const SweepConfiguration& config);

	typedef std::pair< std::unique_ptr<UniformAnalogWaveform>, std::unique_ptr<UniformAnalogWaveform> > CapturePair;

	void Initialize(double amplitude);
	void PrepareForFrequency(double hz);
	CapturePair CaptureChannels();

	void EscalateRange(size_t channel);
	void UpdateExpectedAmplitude(size_t channel, double vpp);

	double GetExpectedAmplitude(size_t channel)
	{ return m_expectedAmplitude[channel]; }

	static int64_t SelectTimebase(const std::vector<int64_t>& scales, double fsPerDiv);
	double SelectRange(double vpp) const;

	Oscilloscope& GetScope()
	{ return m_scope; }

protected:
	void CheckOnline();
	void CheckClipping(const UniformAnalogWaveform& wfm, size_t channel);

	Oscilloscope& m_scope;

	size_t m_inputChannel;
	size_t m_outputChannel;
	bool m_manual;
	double m_cyclesOnScreen;
	double m_headroom;
	double m_clipThreshold;
	double m_minimumRange;
	unsigned int m_triggerTimeoutMs;

	///@brief Expected peak-to-peak amplitude per scope channel, in volts
	std::map<size_t, double> m_expectedAmplitude;
};

#endif
