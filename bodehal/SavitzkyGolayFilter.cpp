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
	@brief Implementation of SavitzkyGolayFilter
 */

#include "bodehal.h"

using namespace std;

SavitzkyGolayFilter::SavitzkyGolayFilter(size_t window, size_t order)
	: m_window(window)
	, m_order(order)
{
	//Need an odd window with more points than coefficients
	if( (m_window % 2) == 0)
		m_window ++;
	if(m_order + 1 > m_window)
		m_order = m_window - 1;
}

/**
	@brief Returns the smoothed data

	Data shorter than the window is returned unchanged.
 */
vector<double> SavitzkyGolayFilter::Apply(const vector<double>& data) const
{
	size_t len = data.size();
	if(len < m_window)
		return data;

	size_t half = m_window / 2;
	vector<double> ret(len);
	for(size_t i=0; i<len; i++)
	{
		size_t start;
		if(i < half)
			start = 0;
		else if(i + half >= len)
			start = len - m_window;
		else
			start = i - half;

		ret[i] = FitAt(data, start, i);
	}
	return ret;
}

/**
	@brief Fits a polynomial to data[start, start+window) and evaluates it at index "at"
 */
double SavitzkyGolayFilter::FitAt(const vector<double>& data, size_t start, size_t at) const
{
	size_t n = m_order + 1;

	//Normal equations A^T A c = A^T y, with x centered on the evaluation point for conditioning
	vector<vector<double>> m(n, vector<double>(n+1, 0));
	for(size_t k=0; k<m_window; k++)
	{
		double x = static_cast<double>(start + k) - static_cast<double>(at);
		double y = data[start + k];

		vector<double> powers(2*n, 1);
		for(size_t p=1; p<2*n; p++)
			powers[p] = powers[p-1] * x;

		for(size_t r=0; r<n; r++)
		{
			for(size_t c=0; c<n; c++)
				m[r][c] += powers[r+c];
			m[r][n] += powers[r] * y;
		}
	}

	//Gaussian elimination with partial pivoting
	for(size_t col=0; col<n; col++)
	{
		size_t pivot = col;
		for(size_t r=col+1; r<n; r++)
		{
			if(fabs(m[r][col]) > fabs(m[pivot][col]))
				pivot = r;
		}
		swap(m[col], m[pivot]);

		for(size_t r=col+1; r<n; r++)
		{
			double f = m[r][col] / m[col][col];
			for(size_t c=col; c<=n; c++)
				m[r][c] -= f * m[col][c];
		}
	}

	vector<double> coeffs(n);
	for(size_t r=n; r-- > 0; )
	{
		double sum = m[r][n];
		for(size_t c=r+1; c<n; c++)
			sum -= m[r][c] * coeffs[c];
		coeffs[r] = sum / m[r][r];
	}

	//x=0 at the evaluation point so only the constant term remains
	return coeffs[0];
}
