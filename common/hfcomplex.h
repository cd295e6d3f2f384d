#ifndef HF_COMPLEX_H
#define HF_COMPLEX_H

#include <complex>
#include <span>


/* In-place radix-2 DFT of a power-of-two sized buffer. A sign of -1 gives
 * the forward transform and +1 the inverse. Neither direction is scaled.
 */
void complex_fft(const std::span<std::complex<double>> buffer, const double sign);

inline void forward_fft(const std::span<std::complex<double>> buffer)
{ complex_fft(buffer, -1.0); }

/* Unnormalized; divide by the size to undo forward_fft. */
inline void inverse_fft(const std::span<std::complex<double>> buffer)
{ complex_fft(buffer, 1.0); }

/* Replaces a real signal (imaginary parts zero) with its analytic signal,
 * whose imaginary part is the discrete Hilbert transform of the input. The
 * size must be a power of two, at least 2.
 */
void complex_hilbert(const std::span<std::complex<double>> buffer);

#endif /* HF_COMPLEX_H */
