
//    --------------------------------------------------------------------
//
//    This file is part of specsus.
//
//    specsus is free software: you can redistribute it and/or modify
//    it under the terms of the GNU General Public License as published by
//    the Free Software Foundation, either version 3 of the License, or
//    (at your option) any later version.
//
//    specsus is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//    You should have received a copy of the GNU General Public License
//    along with specsus. If not, see <http://www.gnu.org/licenses/>.
//
//    Please see LICENSE.txt for more details.
//
//    --------------------------------------------------------------------

#include "dsp/peaks.h"
#include "helper/helper.h"
#include "miscmath/miscmath.h"

#include <cmath>
#include <algorithm>

void peaks_t::detect( const std::vector<double> * x )
{

  pk.clear();
  values.clear();
  ismin.clear();
  prominences.clear();
  
  const int n = x->size();

  if ( n < 3 ) return;
  
  //
  // mask clipped points?
  //

  std::vector<bool> clipped( n , false );

  if ( th_clipped )
    {

      double overall_min, overall_max;
      
      // get signal min/max empirically
      MiscMath::minmax( *x , &overall_min , &overall_max );
      
      for (int i=0; i<n; i++)
	{
	  
	  const bool at_max = max && fabs( overall_max - (*x)[i] ) <= EPS;
	  const bool at_min = min && fabs( (*x)[i] - overall_min ) <= EPS;
	  if ( ! ( at_max || at_min ) ) continue;

	  const double ref = at_max ? overall_max : overall_min;
	  
	  int j;
	  for ( j = i + 1 ; j < n; j++)
	    if ( fabs( ref - (*x)[j] ) > EPS ) break; 
	  
	  // 1 2 3 4
	  // X X X .
	  
	  if ( j - i >= th_clipped )
	    for (int k=i; k<j; k++) clipped[k] = true;
	  
	  // advance (point 'j' is not clipped)
	  i = j - 1;
	  
	}
    }
  

  //
  // end points not included; a flat top (equal neighbouring samples)
  // is reported at its middle sample
  //

  for (int i=1; i<(n-1); i++)
    {
      
      // if at/by a clipped signal part, we can skip
      if ( clipped[i] || clipped[i-1] ) continue;

      if ( max && (*x)[i] > (*x)[i-1] )
	{
	  int j = i + 1;
	  while ( j < n - 1 && (*x)[j] == (*x)[i] ) ++j;
	  if ( (*x)[j] < (*x)[i] && ! clipped[j] )
	    {
	      const int mid = ( i + j - 1 ) / 2;
	      pk.push_back( mid );
	      values.push_back( (*x)[mid] );
	      ismin.push_back( false );
	    }
	}
      
      if ( min && (*x)[i] < (*x)[i-1] ) 
	{
	  int j = i + 1;
	  while ( j < n - 1 && (*x)[j] == (*x)[i] ) ++j;
	  if ( (*x)[j] > (*x)[i] && ! clipped[j] )
	    {
	      const int mid = ( i + j - 1 ) / 2;
	      pk.push_back( mid );
	      values.push_back( (*x)[mid] );
	      ismin.push_back( true );
	    }
	}
      
      // next point
    }
  
  if ( distance > 1 ) select_by_distance( x );

  // prominences are always reported
  select_by_prominence( x );
  
}


void peaks_t::select_by_distance( const std::vector<double> * x )
{

  // highest peaks first; drop any lower peak (of the same polarity)
  // closer than 'distance' samples to one already kept
  
  const int np = pk.size();
  const int d = (int)ceil( distance );
  
  std::vector<int> order( np );
  for (int i=0; i<np; i++) order[i] = i;

  std::stable_sort( order.begin() , order.end() ,
		    [this]( int a , int b ) {
		      const double va = ismin[a] ? -values[a] : values[a];
		      const double vb = ismin[b] ? -values[b] : values[b];
		      return va > vb; } );
  
  std::vector<bool> keep( np , true );

  for (int oi=0; oi<np; oi++)
    {
      const int i = order[oi];
      if ( ! keep[i] ) continue;

      // peaks are in sample order, so scan outwards
      for (int j=i-1; j>=0 && pk[i] - pk[j] < d; j--)
	if ( ismin[j] == ismin[i] ) keep[j] = false;
      for (int j=i+1; j<np && pk[j] - pk[i] < d; j++)
	if ( ismin[j] == ismin[i] ) keep[j] = false;
    }
  
  std::vector<int> pk2;
  std::vector<double> values2;
  std::vector<bool> ismin2;
  for (int i=0; i<np; i++)
    if ( keep[i] )
      {
	pk2.push_back( pk[i] );
	values2.push_back( values[i] );
	ismin2.push_back( ismin[i] );
      }
  pk = pk2;
  values = values2;
  ismin = ismin2;
}


double peaks_t::peak_prominence( const std::vector<double> * x , int p , bool is_min ) const
{

  const int n = x->size();
  
  // work on the flipped signal for troughs
  const double sgn = is_min ? -1 : 1;
  const double h = sgn * (*x)[p];
  
  // lowest point before reaching a higher sample (or the edge), each side
  double left_min = h;
  for (int i=p-1; i>=0; i--)
    {
      const double v = sgn * (*x)[i];
      if ( v > h ) break;
      if ( v < left_min ) left_min = v;
    }

  double right_min = h;
  for (int i=p+1; i<n; i++)
    {
      const double v = sgn * (*x)[i];
      if ( v > h ) break;
      if ( v < right_min ) right_min = v;
    }

  return h - ( left_min > right_min ? left_min : right_min );
}


void peaks_t::select_by_prominence( const std::vector<double> * x )
{
  std::vector<int> pk2;
  std::vector<double> values2;
  std::vector<bool> ismin2;
  
  for (int i=0; i<pk.size(); i++)
    {
      const double prom = peak_prominence( x , pk[i] , ismin[i] );
      if ( prom < prominence ) continue;
      pk2.push_back( pk[i] );
      values2.push_back( values[i] );
      ismin2.push_back( ismin[i] );
      prominences.push_back( prom );
    }

  pk = pk2;
  values = values2;
  ismin = ismin2;
}
