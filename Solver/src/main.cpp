// owgrid: capacity expansion planning of an offshore wind transmission grid

#include "../inc/model.h"

int main(int argc, char **argv)
{
	PRINT_SECTION("Offshore Wind Transmission Network Expansion");

	/* ******************* Process arguments ***************** */
	if (argc < 2) {
		std::cerr << "Usage: owgrid <workspace> [-d|-hs|-c] [-n|-i] [-sf|-mf] [-lin|-ceil]" << std::endl;
		return EXIT_FAILURE;
	}
	const std::string directory = argv[1];

	int failedStages = 0;
	try {
		ReadWrite rw;
		Model gridModel;
		rw.set_inputDirectory(directory + "/input");
		rw.set_outputDirectory(directory + "/output");
		gridModel.set_output_directory(directory + "/output");

		/* ***************** Read Parameters Data ************ */
		PRINT_SECTION("Reading Parameters");
		rw.readParameters(gridModel);
		// command-line switches override the parameter file
		for (int i = 2; i < argc; i++) {
			if (!rw.applySwitch(gridModel, argv[i])) {
				std::cerr << "Unknown option " << argv[i] << std::endl;
				return EXIT_FAILURE;
			}
		}

		/* ******************* Read Data of the Grid ************************ */
		PRINT_SECTION("Reading System Data");
		rw.readSystemData(gridModel);

		PRINT_SECTION("Filtering Viable Connections");
		gridModel.filterNetwork();

		/* ******************* Solve the model ****************** */
		failedStages = gridModel.optimize(&rw);
	}
	catch (const InputDataError &e) {
		std::cerr << "Input data error: " << e.what() << std::endl;
		return EXIT_FAILURE;
	}
	catch (GRBException &e) {
		std::cerr << "Gurobi error <" << e.getErrorCode() << ">: " << e.getMessage() << std::endl;
		return EXIT_FAILURE;
	}

	if (failedStages > 0) {
		std::cerr << failedStages << " stage(s) without a usable solution" << std::endl;
		return EXIT_FAILURE;
	}
	return EXIT_SUCCESS;
}
