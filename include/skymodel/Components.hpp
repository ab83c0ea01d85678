#pragma once
#include "Component.hpp"
#include "Templates.hpp"
#include <optional>
#include <string>

namespace skymodel {

/* Synchrotron: power law in Rayleigh-Jeans temperature,
 *     s(nu) = (nu / nu_ref)^beta
 * (BeyondPlanck 2020, Sec. 3.3.1, with zero curvature). */
class Synchrotron : public Component {
public:
    Synchrotron(Quantity amp, Quantity freq_ref, Quantity beta);

    std::string label() const override { return "synch"; }
    std::string name()  const override { return "Synchrotron"; }
    Array2D get_freq_scaling(double freq_hz) const override;

private:
    Array2D beta_;
};

/* Thermal dust: modified blackbody with emissivity index beta and dust
 * temperature T (BeyondPlanck 2020, Sec. 3.3.3). */
class ThermalDust : public Component {
public:
    ThermalDust(Quantity amp, Quantity freq_ref, Quantity beta, Quantity T);

    std::string label() const override { return "dust"; }
    std::string name()  const override { return "ThermalDust"; }
    Array2D get_freq_scaling(double freq_hz) const override;

private:
    Array2D beta_;
    Array2D T_;       // K
};

/* Free-free: nu^-2 times the Gaunt factor ratio at electron temperature
 * T_e (BeyondPlanck 2020, Sec. 3.3.2). */
class FreeFree : public Component {
public:
    FreeFree(Quantity amp, Quantity freq_ref, Quantity T_e);

    std::string label() const override { return "ff"; }
    std::string name()  const override { return "FreeFree"; }
    Array2D get_freq_scaling(double freq_hz) const override;

private:
    Array2D T_e_;     // K
};

/* Spinning dust: the spdust2 template shifted by 30 GHz / freq_peak
 * (BeyondPlanck 2020, Sec. 3.3.4).  The template belongs to the instance. */
class AME : public Component {
public:
    AME(Quantity amp, Quantity freq_ref, Quantity freq_peak,
        SpinningDustTemplate spdust2);
    AME(Quantity amp, Quantity freq_ref, Quantity freq_peak,
        const std::string& spdust2_path);

    std::string label() const override { return "ame"; }
    std::string name()  const override { return "AME"; }
    Array2D get_freq_scaling(double freq_hz) const override;

    const SpinningDustTemplate& spdust2() const { return spdust2_; }

private:
    void init_parameters();

    SpinningDustTemplate spdust2_;
    Array2D              freq_peak_;   // Hz
};

/* CMB: thermodynamic to Rayleigh-Jeans conversion x^2 e^x / (e^x - 1)^2,
 * x = h nu / k T0.  Amplitudes are in K_CMB units, scaled maps are in the
 * matching K_RJ unit.
 *
 * remove_dipole() mutates the intensity map and must not race with any
 * other call on the same instance. */
class CMB : public Component {
public:
    CMB(Quantity amp, Quantity freq_ref);

    std::string label() const override { return "cmb"; }
    std::string name()  const override { return "CMB"; }
    Array2D get_freq_scaling(double freq_hz) const override;

    // (1, npix) dipole of the intensity map, |b| < gal_cut masked in the fit.
    // Once a dipole has been removed the cached map is returned instead.
    Array2D get_dipole(double gal_cut_deg = 10.0) const;

    // Subtract the fitted dipole from the intensity map.  Repeated calls
    // are no-ops.
    void remove_dipole(double gal_cut_deg = 10.0);

    bool dipole_removed() const { return removed_dipole_.has_value(); }

protected:
    Unit scaled_unit() const override;

private:
    Array2D fit_intensity_dipole(double gal_cut_deg) const;

    std::optional<Array2D> removed_dipole_;
};

/* Radio point sources: power law (nu / nu_ref)^(alpha - 2) per source. */
class Radio : public Component {
public:
    Radio(Quantity amp, Quantity freq_ref, Quantity alpha,
          PointSourceCatalog catalog);
    Radio(Quantity amp, Quantity freq_ref, Quantity alpha,
          const std::string& catalog_path);

    std::string label() const override { return "radio"; }
    std::string name()  const override { return "Radio"; }
    Array2D get_freq_scaling(double freq_hz) const override;

    const PointSourceCatalog& catalog() const { return catalog_; }

private:
    PointSourceCatalog catalog_;
    Array2D            alpha_;
};

} // namespace skymodel
