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
	@brief Declaration of MeasurementExtractor
 */

#ifndef MeasurementExtractor_h
#define MeasurementExtractor_h

/**
	@brief Gain and phase of the DUT at one frequency
 */
class MeasurementResult
{
public:
	MeasurementResult()
		: m_frequency(0)
		, m_gain(0)
		, m_inputRms(0)
		, m_outputRms(0)
		, m_lowConfidence(false)
	{}

	///@brief Stimulus frequency, in Hz
	double m_frequency;

	///@brief Output over input amplitude, in dB
	double m_gain;

	///@brief Phase of the output relative to the input, in degrees. Positive when the output leads.
	std::optional<double> m_phase;

	///@brief AC RMS amplitude of the input, in volts
	double m_inputRms;

	///@brief AC RMS amplitude of the output, in volts
	double m_outputRms;

	///@brief Set when the capture was too short or too coarsely sampled to fully trust the numbers
	bool m_lowConfidence;
};

/**
	@brief Reduces a pair of synchronized captures to gain and phase

	Stateless apart from its thresholds: the same waveforms always give the same result.
 */
class MeasurementExtractor
{
public:
	MeasurementExtractor(double noiseFloor = 1e-3, double nyquistFraction = 0.4);

	MeasurementResult Extract(
		const UniformAnalogWaveform& input,
		const UniformAnalogWaveform& output,
		double hz) const;

	static size_t GetWholePeriodSampleCount(const UniformAnalogWaveform& wfm, double hz);
	static double GetMean(const UniformAnalogWaveform& wfm, size_t len);
	static double GetACRms(const UniformAnalogWaveform& wfm, size_t len);

	static void FindRisingZeroCrossings(
		const UniformAnalogWaveform& wfm,
		float threshold,
		float hysteresis,
		std::vector<double>& edges);

	static std::optional<double> MeasurePhase(
		const std::vector<double>& inputEdges,
		const std::vector<double>& outputEdges,
		double hz);

	static double NormalizePhase(double degrees);

	double GetNoiseFloor() const
	{ return m_noiseFloor; }

protected:
	static float InterpolateTime(const UniformAnalogWaveform& wfm, size_t a, float voltage);

	///@brief RMS level below which a channel carries no usable signal, in volts
	double m_noiseFloor;

	///@brief Fraction of the sample rate above which results are flagged low confidence
	double m_nyquistFraction;
};

#endif
