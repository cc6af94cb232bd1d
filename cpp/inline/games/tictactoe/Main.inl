#include "games/tictactoe/Main.hpp"

#include "games/tictactoe/Game.hpp"
#include "games/tictactoe/players/HumanTuiPlayer.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exceptions.hpp"
#include "util/LoggingUtil.hpp"

#include <boost/program_options.hpp>

#include <iostream>

namespace tictactoe {

inline int Main::main(int ac, char* av[], std::istream& in, std::ostream& out,
                       std::ostream& err) {
  try {
    namespace po = boost::program_options;
    namespace po2 = boost_util::program_options;

    util::Logging::Params log_params;
    HumanTuiPlayer::Params player_params;

    po2::options_description raw_desc("General options");
    auto desc = raw_desc.template add_option<"help", 'h'>("help (most used options)")
                  .template add_option<"help-full">("help (all options)")
                  .add(player_params.make_options_description())
                  .add(log_params.make_options_description());

    po::variables_map vm = po2::parse_args(desc, ac, av);

    bool help_full = vm.count("help-full");
    bool help = vm.count("help");
    if (help || help_full) {
      po2::Settings::help_full = help_full;
      out << desc << std::endl;
      return 0;
    }

    util::Logging::init(log_params);
    LOG_DEBUG("Starting tictactoe");

    Game game;
    HumanTuiPlayer player(player_params, in, out, err);
    if (!player.play(game)) {
      LOG_DEBUG("Input ended before the game was finished");
    }
  } catch (const util::CleanException& e) {
    err << "Caught a CleanException: " << e.what() << std::endl;
    return 1;
  } catch (const util::Exception& e) {
    LOG_ERROR("tictactoe: {}", e.what());
    return 1;
  }

  return 0;
}

}  // namespace tictactoe
