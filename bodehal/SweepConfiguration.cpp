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
	@brief Implementation of SweepConfiguration
 */

#include "bodehal.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

SweepConfiguration::SweepConfiguration()
	: m_minFrequency(1e3)
	, m_maxFrequency(1e6)
	, m_points(50)
	, m_linear(false)
	, m_stepTimeMs(0)
	, m_initialSettleMs(50)
	, m_retries(2)
	, m_cyclesOnScreen(5)
	, m_headroom(0.8)
	, m_clipThreshold(0.98)
	, m_minimumRange(0.008)
	, m_triggerTimeoutMs(2000)
	, m_inputChannel(0)
	, m_outputChannel(1)
	, m_manualSettings(false)
	, m_phase(false)
	, m_noiseFloor(1e-3)
	, m_nyquistFraction(0.4)
	, m_generatorPort("/dev/ttyUSB0")
	, m_generatorDriver("jds6600")
	, m_generatorChannel(0)
	, m_amplitude(5)
	, m_scopeAddress("auto")
	, m_scopeDriver("rigol")
	, m_discoveryTimeoutMs(1000)
	, m_plotPath("bode.png")
	, m_smoothing(true)
	, m_demo(false)
	, m_demoCornerFrequency(10e3)
	, m_demoNoise(1e-3)
{
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Loading

/**
	@brief Loads settings from a YAML file

	@return False if the file could not be read or parsed
 */
bool SweepConfiguration::Load(const string& path)
{
	try
	{
		auto docs = YAML::LoadAllFromFile(path);
		if(docs.empty())
		{
			LogError("Configuration file %s is empty\n", path.c_str());
			return false;
		}
		return Load(docs[0]);
	}
	catch(const YAML::BadFile& ex)
	{
		LogError("Unable to open configuration file %s\n", path.c_str());
		return false;
	}
	catch(const YAML::Exception& ex)
	{
		LogError("Bad configuration file %s: %s\n", path.c_str(), ex.what());
		return false;
	}
}

bool SweepConfiguration::LoadFromString(const string& text)
{
	try
	{
		return Load(YAML::Load(text));
	}
	catch(const YAML::Exception& ex)
	{
		LogError("Bad configuration: %s\n", ex.what());
		return false;
	}
}

/**
	@brief Frequencies may be plain numbers or carry an SI suffix ("2.2M")
 */
double SweepConfiguration::ParseFrequency(const YAML::Node& node)
{
	auto f = Unit(Unit::UNIT_HZ).ParseString(node.as<string>());
	if(std::isnan(f))
		throw YAML::TypedBadConversion<double>(node.Mark());
	return f;
}

/**
	@brief Applies every key present in the node. Missing keys keep their current value.
 */
bool SweepConfiguration::Load(const YAML::Node& node)
{
	try
	{
		auto sweep = node["sweep"];
		if(sweep)
		{
			if(sweep["min"])
				m_minFrequency = ParseFrequency(sweep["min"]);
			if(sweep["max"])
				m_maxFrequency = ParseFrequency(sweep["max"]);
			if(sweep["points"])
				m_points = sweep["points"].as<size_t>();
			if(sweep["linear"])
				m_linear = sweep["linear"].as<bool>();
			if(sweep["step_time_ms"])
				m_stepTimeMs = sweep["step_time_ms"].as<unsigned int>();
			if(sweep["initial_settle_ms"])
				m_initialSettleMs = sweep["initial_settle_ms"].as<unsigned int>();
			if(sweep["retries"])
				m_retries = sweep["retries"].as<unsigned int>();
		}

		auto capture = node["capture"];
		if(capture)
		{
			if(capture["cycles"])
				m_cyclesOnScreen = capture["cycles"].as<double>();
			if(capture["headroom"])
				m_headroom = capture["headroom"].as<double>();
			if(capture["clip_threshold"])
				m_clipThreshold = capture["clip_threshold"].as<double>();
			if(capture["min_range"])
				m_minimumRange = capture["min_range"].as<double>();
			if(capture["trigger_timeout_ms"])
				m_triggerTimeoutMs = capture["trigger_timeout_ms"].as<unsigned int>();
			if(capture["input_channel"])
				m_inputChannel = capture["input_channel"].as<size_t>();
			if(capture["output_channel"])
				m_outputChannel = capture["output_channel"].as<size_t>();
			if(capture["manual"])
				m_manualSettings = capture["manual"].as<bool>();
		}

		auto measurement = node["measurement"];
		if(measurement)
		{
			if(measurement["phase"])
				m_phase = measurement["phase"].as<bool>();
			if(measurement["noise_floor"])
				m_noiseFloor = measurement["noise_floor"].as<double>();
			if(measurement["nyquist_fraction"])
				m_nyquistFraction = measurement["nyquist_fraction"].as<double>();
		}

		auto instruments = node["instruments"];
		if(instruments)
		{
			if(instruments["generator"])
				m_generatorPort = instruments["generator"].as<string>();
			if(instruments["generator_driver"])
				m_generatorDriver = instruments["generator_driver"].as<string>();
			if(instruments["generator_channel"])
				m_generatorChannel = instruments["generator_channel"].as<int>();
			if(instruments["amplitude"])
				m_amplitude = instruments["amplitude"].as<double>();
			if(instruments["scope"])
				m_scopeAddress = instruments["scope"].as<string>();
			if(instruments["scope_driver"])
				m_scopeDriver = instruments["scope_driver"].as<string>();
			if(instruments["discovery_timeout_ms"])
				m_discoveryTimeoutMs = instruments["discovery_timeout_ms"].as<unsigned int>();
		}

		auto output = node["output"];
		if(output)
		{
			if(output["csv"])
				m_csvPath = output["csv"].as<string>();
			if(output["plot"])
				m_plotPath = output["plot"].as<string>();
			if(output["smoothing"])
				m_smoothing = output["smoothing"].as<bool>();
		}

		auto demo = node["demo"];
		if(demo)
		{
			if(demo["enabled"])
				m_demo = demo["enabled"].as<bool>();
			if(demo["corner"])
				m_demoCornerFrequency = ParseFrequency(demo["corner"]);
			if(demo["noise"])
				m_demoNoise = demo["noise"].as<double>();
		}
	}
	catch(const YAML::Exception& ex)
	{
		LogError("Bad configuration value: %s\n", ex.what());
		return false;
	}

	return true;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Serialization

/**
	@brief Emits the effective configuration in the same layout Load() reads
 */
YAML::Node SweepConfiguration::Serialize() const
{
	YAML::Node node;

	YAML::Node sweep;
	sweep["min"] = m_minFrequency;
	sweep["max"] = m_maxFrequency;
	sweep["points"] = m_points;
	sweep["linear"] = m_linear;
	sweep["step_time_ms"] = m_stepTimeMs;
	sweep["initial_settle_ms"] = m_initialSettleMs;
	sweep["retries"] = m_retries;
	node["sweep"] = sweep;

	YAML::Node capture;
	capture["cycles"] = m_cyclesOnScreen;
	capture["headroom"] = m_headroom;
	capture["clip_threshold"] = m_clipThreshold;
	capture["min_range"] = m_minimumRange;
	capture["trigger_timeout_ms"] = m_triggerTimeoutMs;
	capture["input_channel"] = m_inputChannel;
	capture["output_channel"] = m_outputChannel;
	capture["manual"] = m_manualSettings;
	node["capture"] = capture;

	YAML::Node measurement;
	measurement["phase"] = m_phase;
	measurement["noise_floor"] = m_noiseFloor;
	measurement["nyquist_fraction"] = m_nyquistFraction;
	node["measurement"] = measurement;

	YAML::Node instruments;
	instruments["generator"] = m_generatorPort;
	instruments["generator_driver"] = m_generatorDriver;
	instruments["generator_channel"] = m_generatorChannel;
	instruments["amplitude"] = m_amplitude;
	instruments["scope"] = m_scopeAddress;
	instruments["scope_driver"] = m_scopeDriver;
	instruments["discovery_timeout_ms"] = m_discoveryTimeoutMs;
	node["instruments"] = instruments;

	YAML::Node output;
	output["csv"] = m_csvPath;
	output["plot"] = m_plotPath;
	output["smoothing"] = m_smoothing;
	node["output"] = output;

	YAML::Node demo;
	demo["enabled"] = m_demo;
	demo["corner"] = m_demoCornerFrequency;
	demo["noise"] = m_demoNoise;
	node["demo"] = demo;

	return node;
}
