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
	@brief Declaration of BodePlotRenderer
 */

#ifndef BodePlotRenderer_h
#define BodePlotRenderer_h

/**
	@brief Draws gain (and optionally phase) versus frequency into a PNG file

	One panel per quantity, stacked vertically. The measured curve is overlaid with a Savitzky-Golay smoothed copy
	unless smoothing is turned off.
 */
class BodePlotRenderer
{
public:
	BodePlotRenderer(bool linear = false, bool smoothing = true);

	void Render(const std::vector<MeasurementResult>& results, bool showPhase, const std::string& path);

	static std::vector<double> GetLinearTicks(double vmin, double vmax, size_t maxTicks = 10);
	static double GetNiceStep(double span, size_t maxTicks);

	int GetWidth() const
	{ return m_width; }

	int GetPanelHeight() const
	{ return m_panelHeight; }

protected:
	void DrawPanel(
		const Cairo::RefPtr<Cairo::Context>& cr,
		int top,
		const std::string& title,
		const std::string& ylabel,
		const std::vector<double>& freqs,
		const std::vector<double>& values,
		Unit yunit);

	void DrawSeries(
		const Cairo::RefPtr<Cairo::Context>& cr,
		const std::vector<double>& freqs,
		const std::vector<double>& values);

	float FrequencyToPosition(double hz);
	float ValueToPosition(double v);

	static void DrawString(float x, float y, const Cairo::RefPtr<Cairo::Context>& cr, const std::string& str, bool bBig);
	static void DrawStringVertical(float x, float y, const Cairo::RefPtr<Cairo::Context>& cr, const std::string& str);
	static void GetStringWidth(
		const Cairo::RefPtr<Cairo::Context>& cr, const std::string& str, bool bBig, int& width, int& height);

	bool m_linear;
	bool m_smoothing;

	SavitzkyGolayFilter m_filter;

	const int m_width;
	const int m_panelHeight;

	const int m_lmargin;
	const int m_rmargin;
	const int m_tmargin;
	const int m_bmargin;

	//Geometry of the panel being drawn
	int m_top;
	int m_bottom;
	int m_left;
	int m_right;
	double m_fmin;
	double m_fmax;
	double m_vmin;
	double m_vmax;
};

#endif
