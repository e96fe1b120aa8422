#include "ce/LinearProgrammingSolver.hpp"

#include <boost/program_options.hpp>

namespace ce {

inline auto LinearProgrammingSolver::Params::make_options_description() {
  namespace po = boost::program_options;

  po::options_description desc("LinearProgrammingSolver options");
  desc.add_options()
    ("violation-tolerance", po::value<double>(&violation_tolerance)->default_value(
       violation_tolerance, "1e-6"),
     "incentive-constraint slack below -tolerance is reported as a violation")
    ("enable-lp-output", po::bool_switch(&enable_backend_output),
     "let the LP backend print its progress");
  return desc;
}

}  // namespace ce
