#include "skymodel/Components.hpp"
#include "skymodel/Dipole.hpp"
#include "skymodel/Healpix.hpp"
#include "skymodel/SpectralModels.hpp"
#include "skymodel/TemplateLoaders.hpp"

#include <iostream>
#include <stdexcept>

namespace skymodel {

/* ----------------------------- Synchrotron ----------------------------- */
Synchrotron::Synchrotron(Quantity amp, Quantity freq_ref, Quantity beta)
    : Component(std::move(amp), std::move(freq_ref), {{"beta", std::move(beta)}})
{
    validate_diffuse(amp_, freq_ref_, params_);
    beta_ = parameter_value("beta", units::dimensionless);
}

Array2D Synchrotron::get_freq_scaling(double freq_hz) const
{
    return sed::power_law(freq_hz, freq_ref_hz(), beta_);
}

/* ----------------------------- ThermalDust ----------------------------- */
ThermalDust::ThermalDust(Quantity amp, Quantity freq_ref, Quantity beta, Quantity T)
    : Component(std::move(amp), std::move(freq_ref),
                {{"beta", std::move(beta)}, {"T", std::move(T)}})
{
    validate_diffuse(amp_, freq_ref_, params_);
    beta_ = parameter_value("beta", units::dimensionless);
    T_    = parameter_value("T", units::K);
}

Array2D ThermalDust::get_freq_scaling(double freq_hz) const
{
    return sed::modified_blackbody(freq_hz, freq_ref_hz(), beta_, T_);
}

/* ------------------------------ FreeFree ------------------------------- */
FreeFree::FreeFree(Quantity amp, Quantity freq_ref, Quantity T_e)
    : Component(std::move(amp), std::move(freq_ref), {{"T_e", std::move(T_e)}})
{
    validate_diffuse(amp_, freq_ref_, params_);
    T_e_ = parameter_value("T_e", units::K);
}

Array2D FreeFree::get_freq_scaling(double freq_hz) const
{
    return sed::free_free(freq_hz, freq_ref_hz(), T_e_);
}

/* -------------------------------- AME ---------------------------------- */
AME::AME(Quantity amp, Quantity freq_ref, Quantity freq_peak,
         SpinningDustTemplate spdust2)
    : Component(std::move(amp), std::move(freq_ref), {{"freq_peak", std::move(freq_peak)}})
{
    validate_diffuse(amp_, freq_ref_, params_);
    spdust2_ = std::move(spdust2);
    init_parameters();
}

AME::AME(Quantity amp, Quantity freq_ref, Quantity freq_peak,
         const std::string& spdust2_path)
    : Component(std::move(amp), std::move(freq_ref), {{"freq_peak", std::move(freq_peak)}})
{
    validate_diffuse(amp_, freq_ref_, params_);
    spdust2_ = load_spdust2_template(spdust2_path);
    init_parameters();
}

void AME::init_parameters()
{
    if (spdust2_.size() < 2)
        throw std::invalid_argument("AME: spdust2 template needs at least two points");
    // the scaling divides by the template at the reference frequency
    if (!(spdust2_.table.row(1).array() > 0.0).all())
        throw std::invalid_argument("AME: spdust2 template brightness must be strictly positive");
    freq_peak_ = parameter_value("freq_peak", units::Hz);
}

Array2D AME::get_freq_scaling(double freq_hz) const
{
    return sed::spinning_dust(freq_hz, freq_ref_hz(), freq_peak_, spdust2_);
}

/* -------------------------------- CMB ---------------------------------- */
CMB::CMB(Quantity amp, Quantity freq_ref)
    : Component(std::move(amp), std::move(freq_ref), {})
{
    validate_diffuse(amp_, freq_ref_, params_);
}

Array2D CMB::get_freq_scaling(double freq_hz) const
{
    // Monopole-only scaling: a single Stokes row broadcast over I, Q, U
    return Array2D::Constant(1, 1, sed::thermodynamical_to_brightness(freq_hz));
}

Unit CMB::scaled_unit() const
{
    Unit u = amp_.unit();
    u.dim[kTemperatureRJ] += u.dim[kTemperatureCMB];
    u.dim[kTemperatureCMB] = 0;
    if (auto pos = u.name.find("_CMB"); pos != std::string::npos)
        u.name.replace(pos, 4, "_RJ");
    return u;
}

Array2D CMB::fit_intensity_dipole(double gal_cut_deg) const
{
    const Eigen::ArrayXd intensity = amp_.value().row(0).transpose();
    const DipoleFit fit = fit_dipole(intensity, gal_cut_deg);
    const Eigen::ArrayXd d = dipole_map(fit, healpix::npix2nside(amp_.cols()));
    return d.transpose();
}

Array2D CMB::get_dipole(double gal_cut_deg) const
{
    if (removed_dipole_) {
        std::cerr << "[CMB] Returning previously removed dipole signal "
                     "(gal_cut = " << gal_cut_deg << " deg ignored).\n";
        return *removed_dipole_;
    }
    return fit_intensity_dipole(gal_cut_deg);
}

void CMB::remove_dipole(double gal_cut_deg)
{
    if (removed_dipole_) {
        std::cerr << "[CMB] Dipole already removed, ignoring repeated remove_dipole().\n";
        return;
    }
    Array2D dipole = fit_intensity_dipole(gal_cut_deg);
    amp_.value().row(0) -= dipole.row(0);
    removed_dipole_ = std::move(dipole);
}

/* ------------------------------- Radio --------------------------------- */
Radio::Radio(Quantity amp, Quantity freq_ref, Quantity alpha,
             PointSourceCatalog catalog)
    : Component(std::move(amp), std::move(freq_ref), {{"alpha", std::move(alpha)}}),
      catalog_(std::move(catalog))
{
    validate_point_source(amp_, freq_ref_, catalog_, params_);
    alpha_ = parameter_value("alpha", units::dimensionless);
}

Radio::Radio(Quantity amp, Quantity freq_ref, Quantity alpha,
             const std::string& catalog_path)
    : Radio(std::move(amp), std::move(freq_ref), std::move(alpha),
            load_radio_catalog(catalog_path))
{}

Array2D Radio::get_freq_scaling(double freq_hz) const
{
    return sed::power_law(freq_hz, freq_ref_hz(), alpha_ - 2.0);
}

} // namespace skymodel
