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
	@brief Declaration of FunctionGenerator
 */

#ifndef FunctionGenerator_h
#define FunctionGenerator_h

/**
	@brief A baseband waveform generator

	Setters return false if the instrument did not accept the new setting. Getters return NAN (or SHAPE_UNKNOWN)
	if the instrument could not be read back.
 */
class FunctionGenerator : public virtual Instrument
{
public:
	FunctionGenerator();
	virtual ~FunctionGenerator();

	virtual unsigned int GetInstrumentTypes() const override
	{ return INST_FUNCTION; }

	///@brief Predefined waveform shapes
	enum WaveShape
	{
		SHAPE_SINE,
		SHAPE_SQUARE,
		SHAPE_TRIANGLE,
		SHAPE_PULSE,
		SHAPE_DC,
		SHAPE_NOISE,
		SHAPE_SAWTOOTH_UP,
		SHAPE_SAWTOOTH_DOWN,

		SHAPE_ARB,

		SHAPE_UNKNOWN
	};

	static std::string GetNameOfShape(WaveShape shape);

	/**
		@brief Returns true if the function generator channel's output is enabled

		@param chan	Channel index
	 */
	virtual bool GetFunctionChannelActive(int chan) =0;

	/**
		@brief Turns a function generator channel on or off

		@param chan	Channel index
		@param on	True to turn the output on, false to turn it off
	 */
	virtual bool SetFunctionChannelActive(int chan, bool on) =0;

	///@brief Gets the amplitude of a channel, in volts peak-to-peak
	virtual float GetFunctionChannelAmplitude(int chan) =0;

	///@brief Sets the amplitude of a channel, in volts peak-to-peak
	virtual bool SetFunctionChannelAmplitude(int chan, float amplitude) =0;

	///@brief Gets the DC offset of a channel, in volts
	virtual float GetFunctionChannelOffset(int chan) =0;

	///@brief Sets the DC offset of a channel, in volts
	virtual bool SetFunctionChannelOffset(int chan, float offset) =0;

	///@brief Gets the frequency of a channel, in Hz
	virtual float GetFunctionChannelFrequency(int chan) =0;

	///@brief Sets the frequency of a channel, in Hz
	virtual bool SetFunctionChannelFrequency(int chan, float hz) =0;

	virtual WaveShape GetFunctionChannelShape(int chan) =0;
	virtual bool SetFunctionChannelShape(int chan, WaveShape shape) =0;

	/**
		@brief Returns the highest frequency the channel can generate, in Hz

		The default implementation reports no limit.
	 */
	virtual float GetFunctionChannelMaxFrequency(int chan);

	/**
		@brief Returns the set of waveform shapes the channel can generate
	 */
	virtual std::vector<WaveShape> GetAvailableWaveformShapes(int chan) =0;

	//Driver registration
public:
	typedef FunctionGenerator* (*GeneratorCreateProcType)(SCPITransport*);
	static void DoAddDriverClass(std::string name, GeneratorCreateProcType proc);

	static FunctionGenerator* CreateFunctionGenerator(std::string driver, SCPITransport* transport);

protected:
	typedef std::map< std::string, GeneratorCreateProcType > GeneratorCreateMapType;
	static GeneratorCreateMapType m_generatorcreateprocs;
};

#define GENERATOR_INITPROC(T) \
	static FunctionGenerator* CreateInstance(SCPITransport* transport) \
	{	return new T(transport); } \
	virtual std::string GetDriverName() const override \
	{ return GetDriverNameInternal(); }

#define AddGeneratorDriverClass(T) FunctionGenerator::DoAddDriverClass(T::GetDriverNameInternal(), T::CreateInstance)

#endif
