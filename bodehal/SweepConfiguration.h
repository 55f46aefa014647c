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
	@brief Declaration of SweepConfiguration
 */

#ifndef SweepConfiguration_h
#define SweepConfiguration_h

/**
	@brief Every setting of a sweep: frequencies, instrument addresses, capture and measurement tuning

	Defaults are usable as-is. A YAML file may override any subset, and the command line overrides the file.

	Example:
	@code
	sweep:
	  min: 1k
	  max: 2.2M
	  points: 100
	capture:
	  cycles: 5
	instruments:
	  scope: 192.168.1.20
	@endcode
 */
class SweepConfiguration
{
public:
	SweepConfiguration();

	bool Load(const std::string& path);
	bool Load(const YAML::Node& node);
	bool LoadFromString(const std::string& text);

	YAML::Node Serialize() const;

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Sweep

	///@brief Lowest frequency, in Hz
	double m_minFrequency;

	///@brief Highest frequency, in Hz
	double m_maxFrequency;

	///@brief Number of frequencies to visit
	size_t m_points;

	///@brief Use linear instead of logarithmic spacing
	bool m_linear;

	///@brief Settle time after each frequency change, in milliseconds
	unsigned int m_stepTimeMs;

	///@brief Settle time before the first point, in milliseconds
	unsigned int m_initialSettleMs;

	///@brief How many times a point is retried after clipping or a trigger timeout
	unsigned int m_retries;

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Capture

	///@brief Minimum number of signal periods on screen
	double m_cyclesOnScreen;

	///@brief Fraction of the full scale range the expected signal may use
	double m_headroom;

	///@brief Peak level, as a fraction of half the full scale range, treated as clipping
	double m_clipThreshold;

	///@brief Smallest full scale range we ever select, in volts
	double m_minimumRange;

	///@brief How long to wait for a trigger beyond the capture window itself, in milliseconds
	unsigned int m_triggerTimeoutMs;

	///@brief Scope channel connected to the DUT input (zero based)
	size_t m_inputChannel;

	///@brief Scope channel connected to the DUT output (zero based)
	size_t m_outputChannel;

	///@brief Never touch the scope's vertical or horizontal settings
	bool m_manualSettings;

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Measurement

	///@brief Measure phase as well as gain
	bool m_phase;

	///@brief RMS level below which a channel carries no usable signal, in volts
	double m_noiseFloor;

	///@brief Fraction of the sample rate above which results are flagged low confidence
	double m_nyquistFraction;

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Instruments

	///@brief Serial port of the generator
	std::string m_generatorPort;

	///@brief Generator driver name
	std::string m_generatorDriver;

	///@brief Generator channel driving the DUT (zero based)
	int m_generatorChannel;

	///@brief Generator amplitude, in volts peak-to-peak
	double m_amplitude;

	///@brief Scope address as host[:port], or "auto" for discovery
	std::string m_scopeAddress;

	///@brief Scope driver name
	std::string m_scopeDriver;

	///@brief How long discovery waits for replies, in milliseconds
	unsigned int m_discoveryTimeoutMs;

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Output

	///@brief CSV export path, empty for none
	std::string m_csvPath;

	///@brief PNG plot path, empty for none
	std::string m_plotPath;

	///@brief Draw the smoothed overlay on the plot
	bool m_smoothing;

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Simulation

	///@brief Run against the simulated instruments
	bool m_demo;

	///@brief Corner frequency of the simulated RC filter, in Hz
	double m_demoCornerFrequency;

	///@brief RMS noise of the simulated scope, in volts
	double m_demoNoise;

protected:
	static double ParseFrequency(const YAML::Node& node);
};

#endif
